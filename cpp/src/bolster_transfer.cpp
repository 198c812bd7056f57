#include "bolster/errors.hpp"
#include "bolster/file_discovery.hpp"
#include "bolster/object_store.hpp"
#include "bolster/progress.hpp"
#include "bolster/transfer_config.hpp"
#include "bolster/transfer_scheduler.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class Error : public std::runtime_error {
   public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

struct CommonOptions {
    std::filesystem::path store_root;
    bolster::TransferConfig config;
};

struct UploadOptions {
    CommonOptions common;
    std::vector<std::filesystem::path> paths;
};

struct DownloadOptions {
    CommonOptions common;
    std::vector<std::string> prefixes;
    bool assume_yes = false;
};

void print_usage() {
    std::cerr << "Usage:\n"
                 "  bolster_transfer upload --store <dir> --prefix <key-prefix> [tuning] "
                 "<path>...\n"
                 "  bolster_transfer download --store <dir> --prefix <key-prefix> --dest <dir> "
                 "[--yes] [tuning] [<relative-prefix>...]\n"
                 "\n"
                 "Tuning (also read from BOLSTER__CHUNK_SIZE_BYTES, BOLSTER__MAX_CONCURRENT_FILES,\n"
                 "BOLSTER__MAX_CONCURRENT_CHUNKS_PER_FILE):\n"
                 "  --chunk-size <bytes>   chunk size, K/M/G suffixes allowed (default 16M)\n"
                 "  --max-files <n>        files transferred at once (default 4)\n"
                 "  --max-chunks <n>       chunks in flight per file (default 10)\n";
}

// Consumes one shared option at argv[i]; returns false when it is not one.
bool parse_common(int argc, char **argv, int &i, CommonOptions &opts) {
    std::string arg = argv[i];
    if (i + 1 >= argc) {
        return false;
    }
    if (arg == "--store") {
        opts.store_root = argv[++i];
    } else if (arg == "--prefix") {
        opts.config.key_prefix = argv[++i];
    } else if (arg == "--chunk-size") {
        opts.config.chunk_size_bytes = static_cast<std::size_t>(bolster::parse_size(argv[++i]));
    } else if (arg == "--max-files") {
        opts.config.max_concurrent_files = static_cast<std::size_t>(bolster::parse_size(argv[++i]));
    } else if (arg == "--max-chunks") {
        opts.config.max_concurrent_chunks_per_file =
            static_cast<std::size_t>(bolster::parse_size(argv[++i]));
    } else {
        return false;
    }
    return true;
}

void check_common(const CommonOptions &opts) {
    if (opts.store_root.empty() || opts.config.key_prefix.empty()) {
        throw Error("missing --store or --prefix option");
    }
    opts.config.validate();
}

UploadOptions parse_upload(int argc, char **argv) {
    UploadOptions opts;
    opts.common.config.apply_environment_overrides();
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(argc, argv, i, opts.common)) {
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            throw Error("unknown or incomplete option: " + arg);
        }
        opts.paths.emplace_back(arg);
    }
    check_common(opts.common);
    if (opts.paths.empty()) {
        throw Error("nothing to upload");
    }
    return opts;
}

DownloadOptions parse_download(int argc, char **argv) {
    DownloadOptions opts;
    opts.common.config.apply_environment_overrides();
    opts.common.config.local_root.clear();
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (parse_common(argc, argv, i, opts.common)) {
            continue;
        }
        if (arg == "--dest" && i + 1 < argc) {
            opts.common.config.local_root = argv[++i];
        } else if (arg == "--yes" || arg == "-y") {
            opts.assume_yes = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw Error("unknown or incomplete option: " + arg);
        } else {
            opts.prefixes.push_back(arg);
        }
    }
    check_common(opts.common);
    if (opts.common.config.local_root.empty()) {
        throw Error("missing --dest option");
    }
    return opts;
}

bool confirm(const std::string &question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

int report(const bolster::BatchResult &batch) {
    std::cout << '\n' << std::left << std::setw(48) << "Path" << ' ' << std::setw(12) << "Size"
              << " MD5\n";
    for (const auto &result : batch.results) {
        if (!result.succeeded()) {
            continue;
        }
        std::cout << std::left << std::setw(48) << result.item.relative_path << ' '
                  << std::setw(12) << bolster::format_bytes(result.total_bytes) << ' '
                  << result.checksum_hex << '\n';
    }
    const std::size_t failed = batch.failed_count();
    if (failed == 0) {
        std::cout << "\nAll " << batch.results.size() << " files transferred." << std::endl;
        return EXIT_SUCCESS;
    }
    std::cerr << "\nFailed files:\n";
    for (const auto &result : batch.results) {
        if (!result.succeeded()) {
            std::cerr << "  " << result.item.relative_path << ": " << result.error->describe()
                      << '\n';
        }
    }
    std::cerr << failed << " of " << batch.results.size() << " files failed." << std::endl;
    return EXIT_FAILURE;
}

int run_batch(const CommonOptions &common, bolster::ObjectStore &store,
              const std::vector<bolster::TransferItem> &items) {
    std::uint64_t total = 0;
    for (const auto &item : items) {
        total += item.size_bytes;
    }
    const auto &config = common.config;
    std::cout << "Transferring " << items.size() << " files (" << bolster::format_bytes(total)
              << "), up to " << config.max_concurrent_files << " files x "
              << config.max_concurrent_chunks_per_file << " chunks of "
              << bolster::format_bytes(config.chunk_size_bytes) << " at once ("
              << bolster::format_bytes(config.memory_ceiling_bytes()) << " buffer ceiling)"
              << std::endl;

    bolster::TransferScheduler scheduler(config, store);
    bolster::ProgressAggregator progress(&std::cout);
    scheduler.attach_progress(progress);
    const bolster::BatchResult batch = scheduler.run(items);
    scheduler.detach_progress();
    progress.render();
    return report(batch);
}

int run_upload(const UploadOptions &opts) {
    const auto items =
        bolster::discover_upload_items(opts.paths, opts.common.config.max_object_size_bytes);
    if (items.empty()) {
        throw Error("no regular files found in the given paths");
    }
    bolster::DirectoryObjectStore store(opts.common.store_root);
    return run_batch(opts.common, store, items);
}

int run_download(const DownloadOptions &opts) {
    bolster::DirectoryObjectStore store(opts.common.store_root);
    const auto &config = opts.common.config;
    const std::string key_root = config.object_key("");

    std::vector<bolster::TransferItem> items;
    for (const auto &object : store.list_objects(key_root)) {
        const std::string relative = object.key.substr(key_root.size());
        bool wanted = opts.prefixes.empty();
        for (const auto &prefix : opts.prefixes) {
            wanted = wanted || relative.rfind(prefix, 0) == 0;
        }
        if (wanted) {
            items.push_back(
                bolster::TransferItem{relative, object.size_bytes, bolster::Direction::Download});
        }
    }
    if (items.empty()) {
        std::cout << "No files found under " << key_root << std::endl;
        return EXIT_SUCCESS;
    }

    std::size_t existing = 0;
    for (const auto &item : items) {
        if (std::filesystem::exists(config.local_root / item.relative_path)) {
            std::cout << "  would overwrite " << (config.local_root / item.relative_path).string()
                      << '\n';
            ++existing;
        }
    }
    if (existing > 0 && !opts.assume_yes) {
        std::ostringstream question;
        question << existing << " existing file(s) would be overwritten. Continue?";
        if (!confirm(question.str())) {
            std::cout << "Download cancelled." << std::endl;
            return EXIT_FAILURE;
        }
    }
    return run_batch(opts.common, store, items);
}

}  // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        print_usage();
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    try {
        if (mode == "upload") {
            return run_upload(parse_upload(argc - 2, argv + 2));
        } else if (mode == "download") {
            return run_download(parse_download(argc - 2, argv + 2));
        } else if (mode == "--help" || mode == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        } else {
            throw Error("unknown mode: " + mode);
        }
    } catch (const Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::invalid_argument &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const bolster::TransferError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
