#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../vt/object_pool.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace vtdesigner::editor {

    // ─── Saved project ───────────────────────────────────────────────────────────
    // Layout (little endian):
    //   [0..3]  Magic "VTDP"
    //   [4]     Format version
    //   [5..6]  Mask size
    //   [7..8]  Last selected object (0xFFFF = none)
    //   [9..10] Name count N
    //   N x     [id LE16][length LE16][UTF-8 bytes], ascending id
    //   [..]    Pool length LE32, then the pool records
    struct ProjectFile {
        vt::ObjectPool object_pool;
        dp::Map<ObjectID, dp::String> object_names;
        u16 mask_size = MIN_MASK_SIZE;
        vt::NullableObjectID last_selected{};

        Result<dp::Vector<u8>> to_bytes() const {
            auto pool_bytes = object_pool.serialize();
            if (!pool_bytes.is_ok())
                return Result<dp::Vector<u8>>::err(pool_bytes.error());
            const auto &records = pool_bytes.value();

            dp::Vector<u8> out;
            for (auto b : PROJECT_FILE_MAGIC)
                out.push_back(b);
            out.push_back(PROJECT_FILE_FORMAT_VERSION);
            vt::detail::put_u16(out, mask_size);
            vt::detail::put_u16(out, last_selected.value);

            dp::Vector<ObjectID> ids;
            for (const auto &[id, name] : object_names)
                ids.push_back(id);
            std::sort(ids.begin(), ids.end());

            vt::detail::put_u16(out, static_cast<u16>(ids.size()));
            for (auto id : ids) {
                const auto &name = object_names.find(id)->second;
                if (name.size() > 0xFFFF) {
                    return Result<dp::Vector<u8>>::err(
                        Error::invalid_data("name of object " + dp::String(std::to_string(id)) + " is too long"));
                }
                vt::detail::put_u16(out, id);
                vt::detail::put_u16(out, static_cast<u16>(name.size()));
                for (char c : name)
                    out.push_back(static_cast<u8>(c));
            }

            u32 len = static_cast<u32>(records.size());
            for (u8 shift = 0; shift < 32; shift += 8)
                out.push_back(static_cast<u8>((len >> shift) & 0xFF));
            out.insert(out.end(), records.begin(), records.end());
            return Result<dp::Vector<u8>>::ok(std::move(out));
        }

        static Result<ProjectFile> from_bytes(const dp::Vector<u8> &data) {
            vt::detail::ByteReader rd{data, 0, data.size()};
            ProjectFile file;

            for (auto expected : PROJECT_FILE_MAGIC) {
                u8 b = 0;
                if (!rd.u8_(b) || b != expected)
                    return Result<ProjectFile>::err(Error::invalid_data("not a project file (bad magic)"));
            }
            u8 version = 0;
            if (!rd.u8_(version))
                return Result<ProjectFile>::err(Error::invalid_data("truncated project header"));
            if (version != PROJECT_FILE_FORMAT_VERSION) {
                return Result<ProjectFile>::err(
                    Error::invalid_data("unsupported project format version " + dp::String(std::to_string(version))));
            }

            u16 selected = NULL_OBJECT_ID;
            u16 name_count = 0;
            if (!rd.u16_(file.mask_size) || !rd.u16_(selected) || !rd.u16_(name_count))
                return Result<ProjectFile>::err(Error::invalid_data("truncated project header"));
            file.last_selected = vt::NullableObjectID{selected};

            for (u16 i = 0; i < name_count; ++i) {
                u16 id = 0;
                u16 len = 0;
                if (!rd.u16_(id) || !rd.u16_(len))
                    return Result<ProjectFile>::err(Error::invalid_data("truncated object name table"));
                dp::String name;
                for (u16 c = 0; c < len; ++c) {
                    u8 b = 0;
                    if (!rd.u8_(b))
                        return Result<ProjectFile>::err(Error::invalid_data("truncated object name"));
                    name += static_cast<char>(b);
                }
                file.object_names[id] = std::move(name);
            }

            u32 pool_len = 0;
            for (u8 shift = 0; shift < 32; shift += 8) {
                u8 b = 0;
                if (!rd.u8_(b))
                    return Result<ProjectFile>::err(Error::invalid_data("truncated pool length"));
                pool_len |= static_cast<u32>(b) << shift;
            }
            if (pool_len != rd.end - rd.pos) {
                return Result<ProjectFile>::err(Error::invalid_data(
                    "pool length " + dp::String(std::to_string(pool_len)) + " does not match the remaining " +
                    dp::String(std::to_string(rd.end - rd.pos)) + " bytes"));
            }

            dp::Vector<u8> records(data.begin() + static_cast<isize>(rd.pos), data.end());
            auto pool = vt::ObjectPool::deserialize(records);
            if (!pool.is_ok())
                return Result<ProjectFile>::err(pool.error());
            file.object_pool = std::move(pool.value());

            echo::category("vtdesigner.editor.file")
                .debug("project decoded: ", file.object_pool.size(), " objects, ", file.object_names.size(), " names");
            return Result<ProjectFile>::ok(std::move(file));
        }
    };

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
