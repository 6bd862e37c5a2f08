#pragma once

#include "svcscan/cli.hpp"
#include "svcscan/config.hpp"
#include "svcscan/lines.hpp"
#include "svcscan/mutation.hpp"
#include "svcscan/report.hpp"
#include "svcscan/scanner.hpp"
#include "svcscan/source.hpp"
#include "svcscan/tracker.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace svcscan::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline file_scan scan_text(std::string_view text, const scan_config& cfg = {}, std::string label = "test") {
        auto source = parse_source_text("/tmp/svcscan_test.yml", text);
        return scan_source(source, std::move(label), cfg);
    }

    inline location_index index_of(const file_scan& scan) {
        location_index index{};
        for (const auto& location : scan.locations) {
            index.record(scan.path, location);
        }
        return index;
    }

    struct cli_result {
        int rc{};
        std::string out{};
        std::string err{};
    };

    inline cli_result run_cli(std::vector<std::string> args) {
        args.insert(args.begin(), "svcscan");
        std::vector<const char*> argv{};
        argv.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }

        std::ostringstream out{};
        std::ostringstream err{};
        cli_result result{};
        result.rc = cli::run(static_cast<int>(argv.size()), argv.data(), out, err);
        result.out = out.str();
        result.err = err.str();
        return result;
    }

}  // namespace svcscan::test::detail
