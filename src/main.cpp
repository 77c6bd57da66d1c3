//
//  main.cpp
//  Looper
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "looper.hpp"
#include "looper_version.hpp"

namespace {

enum class Mode { None, List, Set, Sort, Convert, Select };

struct Options {
    Mode mode = Mode::None;
    std::string input;
    std::string config_path;
    std::string set_row;
    std::string set_column;
    std::string set_text;
    std::string sort_order;
    std::string convert_output;
    std::string select_number;
};

void print_usage() {
    std::cerr << "Looper " << LOOPER_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  looper <timestamps.tmsp|legacy.txt> --list\n"
              << "  looper <timestamps.tmsp> --set ROW COL TEXT\n"
              << "  looper <timestamps.tmsp> --sort asc|desc\n"
              << "  looper <legacy.txt> --convert <output.tmsp>\n"
              << "  looper <timestamps.tmsp|legacy.txt> --select N\n"
              << "Options:\n"
              << "  --config PATH       JSON configuration file.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  ROW is 0-based, COL is 0 (start), 1 (end) or 2 (description).\n"
              << "  N is the 1-based interval number.\n";
}

std::optional<long> parse_long(const std::string &s) {
    if (s.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

bool set_mode(Options &opts, Mode mode) {
    if (opts.mode != Mode::None) {
        std::cerr << "Only one of --list, --set, --sort, --convert, --select may be given.\n";
        return false;
    }
    opts.mode = mode;
    return true;
}

int run_list(const Options &opts) {
    auto loaded = looper::load_interval_source(opts.input);
    if (!loaded.status.ok) {
        LP_LOG("error", "looper: failed to load " << opts.input << ": " << loaded.status.message);
        return 1;
    }
    std::cout << looper::serialize_interval_list(loaded.intervals) << "\n";
    return 0;
}

int run_set(const Options &opts, const looper::LooperConfig &config) {
    const auto row = parse_long(opts.set_row);
    const auto column = parse_long(opts.set_column);
    if (!row || !column || *row < 0) {
        std::cerr << "Invalid ROW/COL. See --help for usage.\n";
        return 2;
    }
    looper::TimestampStore store(config);
    if (!store.load(opts.input).ok) {
        return 1;
    }
    auto status = store.set_value(static_cast<size_t>(*row), static_cast<int>(*column),
                                  opts.set_text);
    if (!status.ok) {
        LP_LOG("error", "looper: " << looper::error_kind_name(status.kind) << ": "
                                   << status.message);
        return 1;
    }
    std::string shown;
    if (store.display_at(static_cast<size_t>(*row), static_cast<int>(*column), shown).ok) {
        std::cout << "Set row " << *row << " " << store.header_at(static_cast<int>(*column))
                  << ": '" << shown << "'\n";
    }
    return 0;
}

int run_sort(const Options &opts, looper::LooperConfig config) {
    bool descending = false;
    if (opts.sort_order == "desc") {
        descending = true;
    } else if (opts.sort_order != "asc") {
        std::cerr << "Sort order must be asc or desc.\n";
        return 2;
    }
    // Sorting from the command line is always persisted.
    config.save_on_sort = true;
    looper::TimestampStore store(config);
    if (!store.load(opts.input).ok) {
        return 1;
    }
    auto status = store.sort(descending);
    if (!status.ok) {
        LP_LOG("error", "looper: failed to sort: " << status.message);
        return 1;
    }
    std::cout << "Sorted " << store.row_count() << " intervals in " << opts.input << "\n";
    return 0;
}

int run_convert(const Options &opts) {
    auto status = looper::convert_legacy_file(opts.input, opts.convert_output);
    if (!status.ok) {
        LP_LOG("error", "looper: failed to convert: " << status.message);
        return 1;
    }
    std::cout << "Wrote: " << opts.convert_output << "\n";
    return 0;
}

int run_select(const Options &opts) {
    const auto number = parse_long(opts.select_number);
    if (!number) {
        std::cerr << "Invalid interval number. See --help for usage.\n";
        return 2;
    }
    looper::Interval selected;
    if (looper::is_legacy_timestamp_path(opts.input)) {
        auto res = looper::load_legacy_file(opts.input, static_cast<int>(*number));
        if (!res.status.ok) {
            LP_LOG("error", "looper: " << res.status.message);
            return 1;
        }
        selected = std::move(res.value);
    } else {
        auto loaded = looper::read_interval_file(opts.input);
        if (!loaded.status.ok) {
            LP_LOG("error", "looper: failed to load " << opts.input << ": "
                                                      << loaded.status.message);
            return 1;
        }
        if (*number < 1 || static_cast<size_t>(*number) > loaded.intervals.size()) {
            LP_LOG("error", "looper: Timestamp num is not valid");
            return 1;
        }
        selected = loaded.intervals.at(static_cast<size_t>(*number) - 1);
    }
    std::cout << selected.start.ms() << " " << selected.end.ms() << " " << selected.description
              << "\n";
    if (auto media = looper::find_companion_media(opts.input)) {
        std::cout << "media: " << *media << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "Looper " << LOOPER_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        print_usage();
        return 0;
    }

    Options opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            looper::set_log_verbosity(looper::parse_log_verbosity(argv[++i]));
        } else if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--list") {
            if (!set_mode(opts, Mode::List)) return 2;
        } else if (arg == "--set" && i + 3 < argc) {
            if (!set_mode(opts, Mode::Set)) return 2;
            opts.set_row = argv[++i];
            opts.set_column = argv[++i];
            opts.set_text = argv[++i];
        } else if (arg == "--sort" && i + 1 < argc) {
            if (!set_mode(opts, Mode::Sort)) return 2;
            opts.sort_order = argv[++i];
        } else if (arg == "--convert" && i + 1 < argc) {
            if (!set_mode(opts, Mode::Convert)) return 2;
            opts.convert_output = argv[++i];
        } else if (arg == "--select" && i + 1 < argc) {
            if (!set_mode(opts, Mode::Select)) return 2;
            opts.select_number = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 1 || opts.mode == Mode::None) {
        print_usage();
        return 2;
    }
    opts.input = positional[0];

    looper::LooperConfig config;
    if (!opts.config_path.empty()) {
        auto loaded = looper::load_config(opts.config_path);
        if (!loaded.status.ok) {
            LP_LOG("error", "looper: " << loaded.status.message);
            return 1;
        }
        config = loaded.config;
    }

    switch (opts.mode) {
        case Mode::List:
            return run_list(opts);
        case Mode::Set:
            return run_set(opts, config);
        case Mode::Sort:
            return run_sort(opts, config);
        case Mode::Convert:
            return run_convert(opts);
        case Mode::Select:
            return run_select(opts);
        case Mode::None:
            break;
    }
    print_usage();
    return 2;
}
