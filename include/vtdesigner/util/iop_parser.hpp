#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../vt/object_pool.hpp"
#include "../vt/relationships.hpp"
#include "file_io.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace vtdesigner::util {

    // ─── IOP (ISOBUS Object Pool) file boundary ─────────────────────────────────
    // Moves pool bytes between disk and ObjectPool. The record codec itself is
    // ObjectPool::serialize / ObjectPool::deserialize.
    class IOPParser {
      public:
        static Result<dp::Vector<u8>> read_iop_file(const dp::String &filepath) { return read_binary_file(filepath); }

        static Result<void> write_iop_file(const dp::String &filepath, const dp::Vector<u8> &data) {
            return write_binary_file(filepath, data);
        }

        // Decode a pool and report (without rejecting) schema violations for `version`
        static Result<vt::ObjectPool> parse_iop_data(const dp::Vector<u8> &data, vt::VTVersion version) {
            auto result = vt::ObjectPool::deserialize(data);
            if (!result.is_ok()) {
                echo::category("vtdesigner.util.iop").warn("pool rejected: ", result.error().message);
                return result;
            }

            const auto &pool = result.value();
            auto violations = vt::find_illegal_children(pool, version);
            for (const auto &v : violations) {
                echo::category("vtdesigner.util.iop")
                    .warn("object ", v.parent, " (", vt::object_type_name(v.parent_type), ") holds ",
                          vt::object_type_name(v.child_type), " ", v.child, " which VT version ",
                          static_cast<u32>(version), " does not allow");
            }
            auto dangling = pool.dangling_references();
            echo::category("vtdesigner.util.iop")
                .info("parsed ", pool.size(), " objects, ", violations.size(), " schema violations, ",
                      dangling.size(), " missing references");
            return result;
        }

        static Result<vt::ObjectPool> load_iop_file(const dp::String &filepath, vt::VTVersion version) {
            auto bytes = read_iop_file(filepath);
            if (!bytes.is_ok())
                return Result<vt::ObjectPool>::err(bytes.error());
            return parse_iop_data(bytes.value(), version);
        }
    };

} // namespace vtdesigner::util
namespace vtdesigner {
    using namespace util;
}
