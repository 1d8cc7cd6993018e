/**
 * @file fastdd.cpp
 * @brief fastdd - dd-style byte range copy driven by io_uring
 *
 * Copies a range of blocks from one file to another, keeping many reads
 * and writes in flight through a pool of registered buffers.
 *
 * Usage: fastdd --if=SRC --of=DST [OPTIONS]
 */

#include <fastdd.hpp>

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

#include <errno.h>
#include <fcntl.h>
#include <getopt.h>
#include <limits.h>
#include <unistd.h>

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    const char *input = nullptr;
    const char *output = nullptr;
    size_t block_size = fastdd::Options::DEFAULT_BLOCK_SIZE;
    std::optional<uint64_t> count;
    uint64_t input_seek = 0;
    uint64_t output_seek = 0;
    std::optional<unsigned> ring_size;
    std::optional<size_t> num_buffers;
    bool progress = false;
    bool verbose = false;
    bool syslog = false;
};

// Long-only option codes
enum {
    OPT_IF = 256,
    OPT_OF,
    OPT_BS,
    OPT_IS,
    OPT_OS,
    OPT_PROGRESS,
    OPT_SYSLOG,
};

// ============================================================================
// Number parsing
// ============================================================================

static bool parse_u64(const char *str, uint64_t &out) {
    if (*str == '\0' || *str == '-') return false;
    char *end;
    errno = 0;
    unsigned long long val = strtoull(str, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = val;
    return true;
}

/* Byte count with optional K/M/G suffix */
static bool parse_size(const char *str, uint64_t &out) {
    if (*str == '\0' || *str == '-') return false;
    char *end;
    errno = 0;
    unsigned long long val = strtoull(str, &end, 10);
    if (errno != 0 || end == str) return false;

    uint64_t scale = 1;
    switch (*end) {
    case 'G':
    case 'g':
        scale = 1024ULL * 1024 * 1024;
        end++;
        break;
    case 'M':
    case 'm':
        scale = 1024ULL * 1024;
        end++;
        break;
    case 'K':
    case 'k':
        scale = 1024;
        end++;
        break;
    default:
        break;
    }
    if (*end != '\0') return false;
    if (val > UINT64_MAX / scale) return false;

    out = val * scale;
    return true;
}

// ============================================================================
// Formatting helpers
// ============================================================================

static void format_bytes(char *buf, size_t bufsz, double bytes) {
    if (bytes >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB", bytes / (1024.0 * 1024.0 * 1024.0));
    else if (bytes >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB", bytes / (1024.0 * 1024.0));
    else if (bytes >= 1024.0) snprintf(buf, bufsz, "%.1f KiB", bytes / 1024.0);
    else snprintf(buf, bufsz, "%.0f B", bytes);
}

static void format_rate(char *buf, size_t bufsz, double bps) {
    if (bps >= 1024.0 * 1024.0 * 1024.0)
        snprintf(buf, bufsz, "%.1f GiB/s", bps / (1024.0 * 1024.0 * 1024.0));
    else if (bps >= 1024.0 * 1024.0) snprintf(buf, bufsz, "%.1f MiB/s", bps / (1024.0 * 1024.0));
    else if (bps >= 1024.0) snprintf(buf, bufsz, "%.1f KiB/s", bps / 1024.0);
    else snprintf(buf, bufsz, "%.0f B/s", bps);
}

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s --if=FILE --of=FILE [OPTIONS]\n"
            "\n"
            "Copy a range of blocks between files using io_uring.\n"
            "\n"
            "Options:\n"
            "  --if FILE              Input file (required)\n"
            "  --of FILE              Output file, created if absent (required)\n"
            "  --bs N                 Block size in bytes (default: %zu). Suffixes: K, M, G\n"
            "  -c, --count N          Number of blocks to copy (default: rest of input)\n"
            "  --is N                 Input seek offset, in blocks (default: 0)\n"
            "  --os N                 Output seek offset, in blocks (default: 0)\n"
            "  -r, --ring-size N      Ring depth (default: 2 x buffers, else %u)\n"
            "  -n, --num-buffers N    Buffer pool size (default: ring / 2, else %zu)\n"
            "  --progress             Show progress during the copy\n"
            "  -v, --verbose          Log engine diagnostics and stats to stderr\n"
            "  --syslog               Forward engine diagnostics to syslog\n"
            "  -h, --help             Show this help\n",
            argv0, fastdd::Options::DEFAULT_BLOCK_SIZE, fastdd::Options::DEFAULT_RING_SIZE,
            fastdd::Options::DEFAULT_NUM_BUFFERS);
}

static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"if", required_argument, nullptr, OPT_IF},
                                        {"of", required_argument, nullptr, OPT_OF},
                                        {"bs", required_argument, nullptr, OPT_BS},
                                        {"count", required_argument, nullptr, 'c'},
                                        {"is", required_argument, nullptr, OPT_IS},
                                        {"os", required_argument, nullptr, OPT_OS},
                                        {"ring-size", required_argument, nullptr, 'r'},
                                        {"num-buffers", required_argument, nullptr, 'n'},
                                        {"progress", no_argument, nullptr, OPT_PROGRESS},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"syslog", no_argument, nullptr, OPT_SYSLOG},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    int opt;
    uint64_t val;
    while ((opt = getopt_long(argc, argv, "c:r:n:vh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case OPT_IF:
            config.input = optarg;
            break;
        case OPT_OF:
            config.output = optarg;
            break;
        case OPT_BS:
            if (!parse_size(optarg, val) || val == 0 || val > UINT_MAX) {
                fprintf(stderr, "fastdd: invalid block size: %s\n", optarg);
                return -1;
            }
            config.block_size = static_cast<size_t>(val);
            break;
        case 'c':
            if (!parse_u64(optarg, val)) {
                fprintf(stderr, "fastdd: invalid count: %s\n", optarg);
                return -1;
            }
            config.count = val;
            break;
        case OPT_IS:
            if (!parse_u64(optarg, config.input_seek)) {
                fprintf(stderr, "fastdd: invalid input seek: %s\n", optarg);
                return -1;
            }
            break;
        case OPT_OS:
            if (!parse_u64(optarg, config.output_seek)) {
                fprintf(stderr, "fastdd: invalid output seek: %s\n", optarg);
                return -1;
            }
            break;
        case 'r':
            if (!parse_u64(optarg, val) || val == 0) {
                fprintf(stderr, "fastdd: ring size must be greater than 0\n");
                return -1;
            }
            if (val > UINT_MAX / 2) {
                fprintf(stderr, "fastdd: ring size too large: %s\n", optarg);
                return -1;
            }
            config.ring_size = static_cast<unsigned>(val);
            break;
        case 'n':
            if (!parse_u64(optarg, val) || val == 0) {
                fprintf(stderr, "fastdd: number of buffers must be greater than 0\n");
                return -1;
            }
            if (val > UINT_MAX / 2) {
                fprintf(stderr, "fastdd: number of buffers too large: %s\n", optarg);
                return -1;
            }
            config.num_buffers = static_cast<size_t>(val);
            break;
        case OPT_PROGRESS:
            config.progress = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case OPT_SYSLOG:
            config.syslog = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    if (optind != argc) {
        fprintf(stderr, "fastdd: unexpected argument '%s'\n", argv[optind]);
        print_usage(argv[0]);
        return -1;
    }
    if (!config.input || !config.output) {
        fprintf(stderr, "fastdd: --if and --of are required\n");
        print_usage(argv[0]);
        return -1;
    }
    return 0;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    if (parse_args(argc, argv, config) != 0) return 1;

    fastdd::Options opts;
    try {
        opts.block_size(config.block_size)
            .input_seek(config.input_seek)
            .output_seek(config.output_seek)
            .progress(config.progress)
            .derive_shape(config.ring_size, config.num_buffers);
        if (config.count) opts.count(*config.count);
        opts.validate();
    } catch (const fastdd::Error &e) {
        fprintf(stderr, "fastdd: %s\n", e.what());
        return 1;
    }

    if (config.syslog) {
        fastdd::install_syslog_handler();
    } else if (config.verbose) {
        fastdd::set_log_handler([](fastdd::LogLevel level, std::string_view msg) {
            fprintf(stderr, "fastdd: [%s] %.*s\n", fastdd::log_level_name(level),
                    static_cast<int>(msg.size()), msg.data());
        });
    }

    int in_fd = open(config.input, O_RDWR | O_CLOEXEC);
    if (in_fd < 0) {
        fprintf(stderr, "fastdd: cannot open '%s': %s\n", config.input, strerror(errno));
        return 1;
    }
    int out_fd = open(config.output, O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (out_fd < 0) {
        fprintf(stderr, "fastdd: cannot open '%s': %s\n", config.output, strerror(errno));
        close(in_fd);
        return 1;
    }

    int status = 0;
    try {
        fastdd::UringRing ring(opts.ring_size());
        fastdd::Copier copier(ring, in_fd, out_fd, opts);
        uint64_t copied = copier.run();

        printf("Successfully copied %" PRIu64 " bytes.\n", copied);

        if (config.verbose) {
            const auto &stats = copier.stats();
            char size_str[32], rate_str[32], block_str[32];
            format_bytes(size_str, sizeof(size_str), static_cast<double>(stats.bytes_copied));
            format_rate(rate_str, sizeof(rate_str), stats.throughput_bps());
            format_bytes(block_str, sizeof(block_str), static_cast<double>(opts.block_size()));

            fprintf(stderr, "Copied %s in %.2fs (%s)\n", size_str,
                    static_cast<double>(stats.elapsed_ns) / 1e9, rate_str);
            fprintf(stderr, "Buffers: %zu x %s, %zu registered, ring depth %u\n",
                    opts.num_buffers(), block_str, stats.registered_buffers, opts.ring_size());
            fprintf(stderr, "Ops: %" PRIu64 " reads (%" PRIu64 " short), %" PRIu64
                            " writes (%" PRIu64 " short)\n",
                    stats.reads_submitted, stats.short_reads, stats.writes_submitted,
                    stats.short_writes);
        }
    } catch (const fastdd::Error &e) {
        fprintf(stderr, "fastdd: error during copy: %s\n", e.what());
        status = 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "fastdd: error: %s\n", e.what());
        status = 1;
    }

    close(in_fd);
    close(out_fd);

    if (config.syslog) {
        fastdd::remove_syslog_handler();
    } else if (config.verbose) {
        fastdd::clear_log_handler();
    }
    return status;
}
