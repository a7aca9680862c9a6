#pragma once

#include <cstdint>
#include <string>

#include <common/config.hpp>
#include <output/image_writer.hpp>
#include <pipeline/types.hpp>

namespace bgs {
    // Owns the output directory of one run and turns OutputRecords into files
    // named after their sequence number, so sorting the names restores
    // capture order as long as sequences fit in cfg.digits.
    class OutputSink {
    public:
        OutputSink(OutputSinkConfig cfg, IImageWriter& writer);

        // Creates the run directory. Unless reuse_dir is set this is a fresh
        // run_<timestamp> sub-directory of cfg.dir. Throws WriteError.
        void open();

        // Fills record.written_path on success. Failures are logged and
        // counted, never thrown.
        bool write(OutputRecord& record);

        std::string file_name_for(uint64_t sequence) const;
        const std::string& directory() const { return dir_; }

        uint64_t written() const { return written_; }
        uint64_t failures() const { return failures_; }

    private:
        OutputSinkConfig cfg_;
        IImageWriter& writer_;
        std::string dir_;
        uint64_t written_ = 0;
        uint64_t failures_ = 0;
        bool width_warned_ = false;
    };
}
