/**
 * @file fwd.hpp
 * @brief Forward declarations for fastdd
 */

#ifndef FASTDD_FWD_HPP
#define FASTDD_FWD_HPP

namespace fastdd {

class Options;
class Error;
class BufferView;
class BufferPool;
class Ring;
class UringRing;
class Registration;
class ProgressReporter;
class Copier;

struct Range;
struct IoOp;
struct Completion;
struct CopyPlan;
struct CopyStats;

} // namespace fastdd

#endif // FASTDD_FWD_HPP
