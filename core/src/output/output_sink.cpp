#include <output/output_sink.hpp>

#include <common/errors.hpp>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace bgs {
    namespace {
        std::string run_stamp() {
            const std::time_t now = std::time(nullptr);
            std::tm tm{};
            localtime_r(&now, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
            return buf;
        }
    } // namespace

    OutputSink::OutputSink(OutputSinkConfig cfg, IImageWriter& writer)
        : cfg_(std::move(cfg)), writer_(writer) {}

    void OutputSink::open() {
        namespace fs = std::filesystem;

        fs::path dir = cfg_.dir;
        if (!cfg_.reuse_dir) {
            const std::string base = "run_" + run_stamp();
            dir = fs::path(cfg_.dir) / base;
            for (int n = 1; fs::exists(dir); ++n) {
                dir = fs::path(cfg_.dir) / (base + "_" + std::to_string(n));
            }
        }

        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec || !fs::is_directory(dir)) {
            throw WriteError("cannot create output directory " + dir.string() +
                             (ec ? ": " + ec.message() : std::string()));
        }

        dir_ = dir.string();
        std::cout << "[OutputSink](open) Output directory: " << dir_ << "\n";
    }

    std::string OutputSink::file_name_for(uint64_t sequence) const {
        std::ostringstream oss;
        oss << cfg_.prefix << std::setw(cfg_.digits) << std::setfill('0') << sequence << cfg_.extension;
        return oss.str();
    }

    bool OutputSink::write(OutputRecord& record) {
        if (dir_.empty()) {
            std::cerr << "[OutputSink](write) sink is not open, dropping frame " << record.sequence << "\n";
            ++failures_;
            return false;
        }

        if (!width_warned_ && std::to_string(record.sequence).size() > static_cast<size_t>(cfg_.digits)) {
            std::cerr << "[OutputSink](write) sequence " << record.sequence << " is wider than "
                      << cfg_.digits << " digits, file names no longer sort in capture order\n";
            width_warned_ = true;
        }

        const std::string path = (std::filesystem::path(dir_) / file_name_for(record.sequence)).string();
        try {
            writer_.encode_and_write(path, record.produced_payload);
        } catch (const WriteError& e) {
            std::cerr << "[OutputSink](write) frame " << record.sequence << ": " << e.what() << "\n";
            ++failures_;
            return false;
        }

        record.written_path = path;
        ++written_;
        return true;
    }
}
