#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config.hh"
#include "dupescan.hh"
#include "ls_dir_rec.hh"
#include "oss.hh"
#include "overwriter.hh"
#include "parse_size.hh"
#include "prune.hh"

using namespace std::literals;

namespace {

std::atomic<bool> cancel_flag{false};

void on_sigint(int) { cancel_flag = true; }

void usage(std::ostream &os) {
  os << "usage: dupescan [options] <path> ...\n"
        "  -E, --exact        compare contents byte by byte instead of hashes\n"
        "  -d, --delete       prompt for files to keep and delete the others\n"
        "  -e, --exclude PAT  glob pattern to skip, repeatable, a leading '-'\n"
        "                     drops the default patterns\n"
        "      --min-size X   ignore files smaller than X (ex. 25, 4KiB)\n"
        "  -j, --jobs N       worker threads\n"
        "      --max-open N   open file budget for exact comparison\n"
        "      --digest NAME  libcrypto digest for hash mode (>= 160 bits)\n"
        "  -q, --quiet        only report errors\n"
        "  -D, --defaults     print default option values and exit\n"
        "  -h, --help         print this message\n";
}

void print_defaults() {
  std::cout << "      exclude: ";
  for (std::size_t i = 0; i < dupescan::default_excludes.size(); ++i) {
    std::cout << (i == 0 ? "" : ", ") << dupescan::default_excludes[i];
  }
  std::cout << "\n     min_size: " << dupescan::default_min_size
            << "\n    head_size: " << dupescan::head_sz
            << "\n   chunk_size: " << dupescan::chunk_sz
            << "\n       digest: " << dupescan::default_digest
            << "\n     max_open: " << dupescan::default_max_open << '\n';
}

}  // namespace

int main(int argc, char *argv[]) {
  std::vector<std::filesystem::path> roots;
  std::vector<std::string> excludes(dupescan::default_excludes.begin(),
                                    dupescan::default_excludes.end());
  bool delete_mode = false;
  dupescan::options_t opts;

  auto next_arg = [&](int &i, std::string_view what) -> std::string_view {
    ++i;
    if (i >= argc) {
      std::cerr << "missing " << what << std::endl;
      std::exit(1);
    }
    return argv[i];
  };

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      if (arg == "-E"sv || arg == "--exact"sv) {
        opts.exact = true;
      } else if (arg == "-d"sv || arg == "--delete"sv) {
        delete_mode = true;
      } else if (arg == "-e"sv || arg == "--exclude"sv) {
        dupescan::add_exclude(excludes, next_arg(i, "exclude pattern"));
      } else if (arg == "--min-size"sv) {
        opts.min_size = dupescan::utils::parse_size(next_arg(i, "min size"));
      } else if (arg == "-j"sv || arg == "--jobs"sv) {
        const auto jobs = std::stoi(std::string(next_arg(i, "jobs")));
        if (jobs <= 0 || jobs > 256) {
          std::cerr << "jobs must be > 0 and <= 256" << std::endl;
          return 1;
        }
        opts.jobs = (uint32_t)jobs;
      } else if (arg == "--max-open"sv) {
        const auto max_open = std::stol(std::string(next_arg(i, "max open")));
        if (max_open <= 0) {
          std::cerr << "max open must be > 0" << std::endl;
          return 1;
        }
        opts.max_open = (std::size_t)max_open;
      } else if (arg == "--digest"sv) {
        opts.digest = next_arg(i, "digest");
      } else if (arg == "-q"sv || arg == "--quiet"sv) {
        dupescan::set_log_level(dupescan::log_lv::err);
      } else if (arg == "-D"sv || arg == "--defaults"sv) {
        print_defaults();
        return 0;
      } else if (arg == "-h"sv || arg == "--help"sv) {
        usage(std::cout);
        return 0;
      } else if (arg.size() > 1 && arg.front() == '-') {
        std::cerr << "unknown option: " << arg << std::endl;
        usage(std::cerr);
        return 1;
      } else {
        roots.emplace_back(arg);
      }
    }
  } catch (const std::exception &e) {
    // parse_size, stoi
    std::cerr << "invalid argument: " << e.what() << std::endl;
    return 1;
  }

  if (roots.empty()) {
    usage(std::cerr);
    return 1;
  }

  std::signal(SIGINT, on_sigint);
  opts.cancel = &cancel_flag;
  dupescan::overwriter_t status(std::cerr, ::isatty(STDERR_FILENO) == 1);
  if (dupescan::log_on(dupescan::log_lv::log)) {
    opts.on_progress = [&status](std::string_view stage, std::size_t done,
                                 std::size_t total, std::size_t files) {
      std::ostringstream msg;
      msg << "Subdividing group " << done << " of " << total << " by "
          << stage << "... (" << files << " files examined)";
      status.write(msg.str(), done == total);
    };
  }

  std::vector<dupescan::group_t> dupe_list;
  try {
    auto paths = dupescan::get_paths(roots, excludes, opts.jobs, &cancel_flag);
    if (paths.empty()) {
      std::cerr << "[log] no files to compare" << std::endl;
      return 0;
    }
    dupe_list = dupescan::to_groups(dupescan::find_dupes(paths, opts));
  } catch (const dupescan::cancelled_error &e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 2;
  } catch (const std::invalid_argument &e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }

  if (delete_mode) {
    std::size_t removed = 0;
    for (std::size_t i = 0; i < dupe_list.size(); ++i) {
      auto rm_list = dupescan::prune_ui(dupe_list[i], i + 1, dupe_list.size(),
                                        std::cin, std::cout);
      removed += dupescan::remove(rm_list);
    }
    std::cerr << "[log] removed " << removed << " files" << std::endl;
  } else {
    for (const auto &dupe : dupe_list) {
      for (const auto &file : dupe) {
        std::cout << file.native() << '\n';
      }
      std::cout << '\n';
    }
  }
  return 0;
}
