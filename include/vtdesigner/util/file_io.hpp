#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cstdio>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace vtdesigner::util {

    // ─── Whole-file binary I/O ───────────────────────────────────────────────────
    inline Result<dp::Vector<u8>> read_binary_file(const dp::String &filepath) {
        FILE *f = fopen(filepath.c_str(), "rb");
        if (!f)
            return Result<dp::Vector<u8>>::err(Error::file_error("failed to open " + filepath));

        fseek(f, 0, SEEK_END);
        long size = ftell(f);
        fseek(f, 0, SEEK_SET);

        if (size <= 0) {
            fclose(f);
            return Result<dp::Vector<u8>>::err(Error::file_error("empty file " + filepath));
        }

        dp::Vector<u8> data(static_cast<usize>(size));
        usize read = fread(data.data(), 1, static_cast<usize>(size), f);
        fclose(f);

        if (read != static_cast<usize>(size))
            return Result<dp::Vector<u8>>::err(Error::file_error("incomplete read of " + filepath));

        echo::category("vtdesigner.util.file").info("read ", filepath, " (", size, " bytes)");
        return Result<dp::Vector<u8>>::ok(std::move(data));
    }

    inline Result<void> write_binary_file(const dp::String &filepath, const dp::Vector<u8> &data) {
        FILE *f = fopen(filepath.c_str(), "wb");
        if (!f)
            return Result<void>::err(Error::file_error("failed to create " + filepath));

        usize written = data.empty() ? 0 : fwrite(data.data(), 1, data.size(), f);
        bool closed = fclose(f) == 0;
        if (written != data.size() || !closed)
            return Result<void>::err(Error::file_error("incomplete write of " + filepath));

        echo::category("vtdesigner.util.file").info("wrote ", filepath, " (", data.size(), " bytes)");
        return {};
    }

} // namespace vtdesigner::util
namespace vtdesigner {
    using namespace util;
}
