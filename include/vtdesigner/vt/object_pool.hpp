#pragma once

// GCC false positive: datapod SSO union member in ObjectPool move constructor
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "objects.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>
#include <utility>

namespace vtdesigner::vt {

    // ─── Dangling reference report ───────────────────────────────────────────────
    enum class ReferenceKind : u8 { Child, ListItem, Field, Macro };

    struct DanglingReference {
        ObjectID owner = NULL_OBJECT_ID;
        ObjectID target = NULL_OBJECT_ID;
        ReferenceKind kind = ReferenceKind::Child;
    };

    // Kinds whose extent comes from their own width/height attributes
    inline constexpr bool has_declared_size(ObjectType type) noexcept {
        switch (type) {
        case ObjectType::Container:
        case ObjectType::Button:
        case ObjectType::InputBoolean:
        case ObjectType::InputString:
        case ObjectType::InputNumber:
        case ObjectType::InputList:
        case ObjectType::OutputString:
        case ObjectType::OutputNumber:
        case ObjectType::OutputList:
        case ObjectType::OutputLine:
        case ObjectType::OutputRectangle:
        case ObjectType::OutputEllipse:
        case ObjectType::OutputPolygon:
        case ObjectType::OutputMeter:
        case ObjectType::OutputLinearBarGraph:
        case ObjectType::OutputArchedBarGraph:
        case ObjectType::PictureGraphic:
        case ObjectType::GraphicsContext:
        case ObjectType::Animation:
        case ObjectType::ScaledGraphic:
            return true;
        default:
            return false;
        }
    }

    namespace detail {
        inline void put_u16(dp::Vector<u8> &out, u16 v) {
            out.push_back(static_cast<u8>(v & 0xFF));
            out.push_back(static_cast<u8>((v >> 8) & 0xFF));
        }

        // Bounds-checked little-endian reader over one record body
        struct ByteReader {
            const dp::Vector<u8> &data;
            usize pos;
            usize end;

            bool u8_(u8 &out) {
                if (pos + 1 > end)
                    return false;
                out = data[pos++];
                return true;
            }
            bool u16_(u16 &out) {
                if (pos + 2 > end)
                    return false;
                out = static_cast<u16>(data[pos]) | (static_cast<u16>(data[pos + 1]) << 8);
                pos += 2;
                return true;
            }
            bool i16_(i16 &out) {
                u16 raw = 0;
                if (!u16_(raw))
                    return false;
                out = static_cast<i16>(raw);
                return true;
            }
        };
    } // namespace detail

    // ─── Object pool ─────────────────────────────────────────────────────────────
    // Insertion-ordered object list with an id index. References are never
    // cleaned up on removal: readers must treat unresolved ids as a display
    // condition, see dangling_references().
    class ObjectPool {
        dp::Vector<VTObject> objects_;
        dp::Map<ObjectID, usize> index_;

        void rebuild_index() {
            index_.clear();
            for (usize i = 0; i < objects_.size(); ++i)
                index_[objects_[i].id] = i;
        }

        // The index goes stale if a caller renumbers through object_by_id_mut
        isize position_of(ObjectID id) const {
            auto it = index_.find(id);
            if (it != index_.end() && it->second < objects_.size() && objects_[it->second].id == id)
                return static_cast<isize>(it->second);
            for (usize i = 0; i < objects_.size(); ++i) {
                if (objects_[i].id == id)
                    return static_cast<isize>(i);
            }
            return -1;
        }

      public:
        Result<void> add(VTObject obj) {
            if (position_of(obj.id) >= 0)
                return Result<void>::err(Error::id_conflict(obj.id));
            index_[obj.id] = objects_.size();
            objects_.push_back(std::move(obj));
            return {};
        }

        // Removes the object only; other objects keep their (now dangling) references
        bool remove(ObjectID id) {
            auto pos = position_of(id);
            if (pos < 0)
                return false;
            objects_.erase(objects_.begin() + pos);
            rebuild_index();
            echo::category("vtdesigner.vt.pool").debug("removed object ", id);
            return true;
        }

        Result<void> change_id(ObjectID from, ObjectID to) {
            auto pos = position_of(from);
            if (pos < 0)
                return Result<void>::err(Error::object_not_found(from));
            if (from == to)
                return {};
            if (to == NULL_OBJECT_ID)
                return Result<void>::err(Error::invalid_data("65535 is reserved as the NULL object ID"));
            if (position_of(to) >= 0)
                return Result<void>::err(Error::id_conflict(to));
            objects_[static_cast<usize>(pos)].id = to;
            rebuild_index();
            return {};
        }

        bool contains(ObjectID id) const { return position_of(id) >= 0; }

        const VTObject *object_by_id(ObjectID id) const {
            auto pos = position_of(id);
            return pos < 0 ? nullptr : &objects_[static_cast<usize>(pos)];
        }

        VTObject *object_by_id_mut(ObjectID id) {
            auto pos = position_of(id);
            return pos < 0 ? nullptr : &objects_[static_cast<usize>(pos)];
        }

        dp::Vector<const VTObject *> objects_by_type(ObjectType type) const {
            dp::Vector<const VTObject *> found;
            for (const auto &obj : objects_) {
                if (obj.type == type)
                    found.push_back(&obj);
            }
            return found;
        }

        dp::Vector<const VTObject *> objects_by_types(const dp::Vector<ObjectType> &types) const {
            dp::Vector<const VTObject *> found;
            for (const auto &obj : objects_) {
                for (auto t : types) {
                    if (obj.type == t) {
                        found.push_back(&obj);
                        break;
                    }
                }
            }
            return found;
        }

        usize count_of_type(ObjectType type) const {
            usize n = 0;
            for (const auto &obj : objects_) {
                if (obj.type == type)
                    n++;
            }
            return n;
        }

        // Reverse-edge scan
        dp::Vector<const VTObject *> parent_objects(ObjectID id) const {
            dp::Vector<const VTObject *> parents;
            for (const auto &obj : objects_) {
                if (obj.references(id))
                    parents.push_back(&obj);
            }
            return parents;
        }

        const VTObject *working_set_object() const {
            for (const auto &obj : objects_) {
                if (obj.type == ObjectType::WorkingSet)
                    return &obj;
            }
            return nullptr;
        }

        dp::Optional<ObjectID> max_object_id() const {
            if (objects_.empty())
                return dp::nullopt;
            ObjectID max_id = 0;
            for (const auto &obj : objects_) {
                if (obj.id > max_id)
                    max_id = obj.id;
            }
            return max_id;
        }

        dp::Vector<DanglingReference> dangling_references() const {
            dp::Vector<DanglingReference> out;
            for (const auto &obj : objects_) {
                for (const auto &ref : obj.object_refs) {
                    if (!contains(ref.id))
                        out.push_back({obj.id, ref.id, ReferenceKind::Child});
                }
                for (auto item : obj.object_list) {
                    if (item != NULL_OBJECT_ID && !contains(item))
                        out.push_back({obj.id, item, ReferenceKind::ListItem});
                }
                for (const auto &f : obj.fields) {
                    if (!f.id.is_null() && !contains(f.id.value))
                        out.push_back({obj.id, f.id.value, ReferenceKind::Field});
                }
                for (const auto &m : obj.macros) {
                    if (!contains(m.macro_id))
                        out.push_back({obj.id, m.macro_id, ReferenceKind::Macro});
                }
            }
            return out;
        }

        // ─── Geometry ─────────────────────────────────────────────────────────────
        Size content_size(const VTObject &object) const { return content_size_at_depth(object, 0); }

        // Deepest positioned descendant of `root` covering `point` (relative to root)
        NullableObjectID object_at(ObjectID root, Point point) const {
            const auto *obj = object_by_id(root);
            if (!obj)
                return NullableObjectID::none();
            return hit_test(*obj, i32(point.x), i32(point.y), 0);
        }

        // Smallest (square) mask and soft key designator that fit every declared extent
        std::pair<u16, Size> minimum_mask_sizes() const {
            u16 mask_size = MIN_MASK_SIZE;
            Size soft_key{MIN_SOFT_KEY_WIDTH, MIN_SOFT_KEY_HEIGHT};
            for (const auto &obj : objects_) {
                switch (obj.type) {
                case ObjectType::DataMask:
                case ObjectType::AlarmMask:
                case ObjectType::WindowMask: {
                    auto extent = children_extent(obj, 0);
                    mask_size = std::max({mask_size, extent.width, extent.height});
                    break;
                }
                case ObjectType::Key: {
                    auto extent = children_extent(obj, 0);
                    soft_key.width = std::max(soft_key.width, extent.width);
                    soft_key.height = std::max(soft_key.height, extent.height);
                    break;
                }
                default:
                    break;
                }
            }
            return {mask_size, soft_key};
        }

        // ─── Container access ─────────────────────────────────────────────────────
        usize size() const noexcept { return objects_.size(); }
        bool empty() const noexcept { return objects_.empty(); }
        void clear() {
            objects_.clear();
            index_.clear();
        }

        const dp::Vector<VTObject> &objects() const noexcept { return objects_; }

        bool operator==(const ObjectPool &other) const { return detail::equal_lists(objects_, other.objects_); }
        bool operator!=(const ObjectPool &other) const { return !(*this == other); }

        ObjectPool &with_object(VTObject obj) {
            auto r = add(std::move(obj));
            if (!r.is_ok())
                echo::category("vtdesigner.vt.pool").warn(r.error().message);
            return *this;
        }

        // ─── Pool codec ───────────────────────────────────────────────────────────
        // Record layout (length-driven):
        //   [0..1] Object ID (LE)
        //   [2]    Object type
        //   [3..4] Body length (LE)
        //   [5..]  width, height, key code, refs, list, fields, macros, attribute bytes
        static dp::Vector<u8> serialize_object(const VTObject &obj) {
            dp::Vector<u8> body;
            detail::put_u16(body, obj.width);
            detail::put_u16(body, obj.height);
            body.push_back(obj.key_code);

            detail::put_u16(body, static_cast<u16>(obj.object_refs.size()));
            for (const auto &ref : obj.object_refs) {
                detail::put_u16(body, ref.id);
                detail::put_u16(body, static_cast<u16>(ref.offset.x));
                detail::put_u16(body, static_cast<u16>(ref.offset.y));
            }
            detail::put_u16(body, static_cast<u16>(obj.object_list.size()));
            for (auto item : obj.object_list)
                detail::put_u16(body, item);

            body.push_back(static_cast<u8>(obj.fields.size()));
            for (const auto &f : obj.fields) {
                body.push_back(static_cast<u8>(f.role));
                detail::put_u16(body, f.id.value);
            }
            body.push_back(static_cast<u8>(obj.macros.size()));
            for (const auto &m : obj.macros) {
                body.push_back(static_cast<u8>(m.event));
                detail::put_u16(body, m.macro_id);
            }
            detail::put_u16(body, static_cast<u16>(obj.attributes.size()));
            for (auto b : obj.attributes)
                body.push_back(b);

            dp::Vector<u8> data;
            detail::put_u16(data, obj.id);
            data.push_back(static_cast<u8>(obj.type));
            detail::put_u16(data, static_cast<u16>(body.size()));
            data.insert(data.end(), body.begin(), body.end());
            return data;
        }

        Result<dp::Vector<u8>> serialize() const {
            dp::Vector<u8> data;
            for (const auto &obj : objects_) {
                // Field and macro counts are single bytes
                if (obj.fields.size() > 0xFF || obj.macros.size() > 0xFF) {
                    return Result<dp::Vector<u8>>::err(Error::invalid_data(
                        "object " + dp::String(std::to_string(obj.id)) + " has more than 255 fields or macros"));
                }
                auto bytes = serialize_object(obj);
                if (bytes.size() - 5 > 0xFFFF) {
                    return Result<dp::Vector<u8>>::err(Error::invalid_data(
                        "object " + dp::String(std::to_string(obj.id)) + " exceeds the record size limit"));
                }
                data.insert(data.end(), bytes.begin(), bytes.end());
            }
            return Result<dp::Vector<u8>>::ok(std::move(data));
        }

        static Result<ObjectPool> deserialize(const dp::Vector<u8> &data) {
            ObjectPool pool;
            usize offset = 0;

            while (offset < data.size()) {
                if (offset + 5 > data.size())
                    return Result<ObjectPool>::err(Error::pool_validation("truncated object header"));

                VTObject obj;
                obj.id = static_cast<u16>(data[offset]) | (static_cast<u16>(data[offset + 1]) << 8);
                u8 raw_type = data[offset + 2];
                u16 body_len = static_cast<u16>(data[offset + 3]) | (static_cast<u16>(data[offset + 4]) << 8);
                offset += 5;

                if (!is_valid_object_type(raw_type)) {
                    return Result<ObjectPool>::err(
                        Error::pool_validation("unknown object type " + dp::String(std::to_string(raw_type)) +
                                               " for object " + dp::String(std::to_string(obj.id))));
                }
                if (offset + body_len > data.size())
                    return Result<ObjectPool>::err(Error::pool_validation("object body extends past pool data"));
                obj.type = static_cast<ObjectType>(raw_type);

                detail::ByteReader rd{data, offset, offset + body_len};
                if (!decode_body(rd, obj)) {
                    return Result<ObjectPool>::err(
                        Error::pool_validation("malformed body for object " + dp::String(std::to_string(obj.id))));
                }
                offset += body_len;

                auto r = pool.add(std::move(obj));
                if (!r.is_ok())
                    return Result<ObjectPool>::err(r.error());
            }

            return Result<ObjectPool>::ok(std::move(pool));
        }

        // ISOBUS object pool naming used throughout the editor
        static Result<ObjectPool> from_iop(const dp::Vector<u8> &data) { return deserialize(data); }
        Result<dp::Vector<u8>> as_iop() const { return serialize(); }

      private:
        static bool decode_body(detail::ByteReader &rd, VTObject &obj) {
            u16 count = 0;
            if (!rd.u16_(obj.width) || !rd.u16_(obj.height) || !rd.u8_(obj.key_code))
                return false;

            if (!rd.u16_(count))
                return false;
            for (u16 i = 0; i < count; ++i) {
                ObjectRef ref;
                if (!rd.u16_(ref.id) || !rd.i16_(ref.offset.x) || !rd.i16_(ref.offset.y))
                    return false;
                obj.object_refs.push_back(ref);
            }
            if (!rd.u16_(count))
                return false;
            for (u16 i = 0; i < count; ++i) {
                ObjectID item = 0;
                if (!rd.u16_(item))
                    return false;
                obj.object_list.push_back(item);
            }

            u8 small_count = 0;
            if (!rd.u8_(small_count))
                return false;
            for (u8 i = 0; i < small_count; ++i) {
                u8 role = 0;
                u16 target = 0;
                if (!rd.u8_(role) || !rd.u16_(target))
                    return false;
                obj.fields.push_back(ObjectField{static_cast<FieldRole>(role), NullableObjectID{target}});
            }
            if (!rd.u8_(small_count))
                return false;
            for (u8 i = 0; i < small_count; ++i) {
                u8 event = 0;
                u16 macro_id = 0;
                if (!rd.u8_(event) || !rd.u16_(macro_id))
                    return false;
                obj.macros.push_back(MacroRef{static_cast<Event>(event), macro_id});
            }

            if (!rd.u16_(count))
                return false;
            for (u16 i = 0; i < count; ++i) {
                u8 b = 0;
                if (!rd.u8_(b))
                    return false;
                obj.attributes.push_back(b);
            }
            return rd.pos == rd.end;
        }

        Size content_size_at_depth(const VTObject &object, usize depth) const {
            if (has_declared_size(object.type))
                return Size{object.width, object.height};
            if (depth >= MAX_TRAVERSAL_DEPTH)
                return Size{};
            if (object.type == ObjectType::ObjectPointer) {
                auto target = object.field(FieldRole::Value);
                if (target.is_null())
                    return Size{};
                const auto *pointee = object_by_id(target.value);
                return pointee ? content_size_at_depth(*pointee, depth + 1) : Size{};
            }
            return children_extent(object, depth);
        }

        // Bounding box of positioned children, anchored at the parent origin
        Size children_extent(const VTObject &object, usize depth) const {
            Size extent{};
            if (depth >= MAX_TRAVERSAL_DEPTH)
                return extent;
            for (const auto &ref : object.object_refs) {
                const auto *child = object_by_id(ref.id);
                if (!child)
                    continue;
                auto size = content_size_at_depth(*child, depth + 1);
                i32 right = i32(ref.offset.x) + size.width;
                i32 bottom = i32(ref.offset.y) + size.height;
                if (right > extent.width)
                    extent.width = static_cast<u16>(std::min<i32>(right, 0xFFFF));
                if (bottom > extent.height)
                    extent.height = static_cast<u16>(std::min<i32>(bottom, 0xFFFF));
            }
            return extent;
        }

        NullableObjectID hit_test(const VTObject &object, i32 x, i32 y, usize depth) const {
            if (depth < MAX_TRAVERSAL_DEPTH) {
                // Later children paint over earlier ones
                for (usize i = object.object_refs.size(); i-- > 0;) {
                    const auto &ref = object.object_refs[i];
                    const auto *child = object_by_id(ref.id);
                    if (!child)
                        continue;
                    auto size = content_size_at_depth(*child, depth + 1);
                    i32 lx = x - ref.offset.x;
                    i32 ly = y - ref.offset.y;
                    if (lx < 0 || ly < 0 || lx >= size.width || ly >= size.height)
                        continue;
                    if (child->type == ObjectType::ObjectPointer) {
                        auto target = child->field(FieldRole::Value);
                        const auto *pointee = target.is_null() ? nullptr : object_by_id(target.value);
                        if (pointee)
                            return hit_test(*pointee, lx, ly, depth + 1);
                        continue;
                    }
                    return hit_test(*child, lx, ly, depth + 1);
                }
            }
            return NullableObjectID{object.id};
        }
    };

} // namespace vtdesigner::vt
namespace vtdesigner {
    using namespace vt;
}

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif
