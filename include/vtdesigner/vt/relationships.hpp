#pragma once

#include "../core/types.hpp"
#include "object_pool.hpp"
#include "objects.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <initializer_list>

namespace vtdesigner::vt {

    // ─── Object relationship schema (ISO 11783-6 Annex B) ────────────────────────
    // Which object types may be nested as children of a given type, per VT
    // version. Every rule starts from its baseline set and later versions only
    // ever append, so allowed_children(T, V1) is a subset of allowed_children(T, V2)
    // whenever V1 <= V2.
    namespace schema {

        inline void append(dp::Vector<ObjectType> &out, std::initializer_list<ObjectType> types) {
            for (auto t : types)
                out.push_back(t);
        }

        inline dp::Vector<ObjectType> working_set(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            append(allowed, {ObjectType::OutputString, ObjectType::OutputNumber, ObjectType::OutputLine,
                             ObjectType::OutputRectangle, ObjectType::OutputEllipse, ObjectType::OutputPolygon,
                             ObjectType::PictureGraphic});
            if (at_least(version, VTVersion::Version4)) {
                append(allowed, {ObjectType::OutputList, ObjectType::OutputMeter, ObjectType::OutputLinearBarGraph,
                                 ObjectType::OutputArchedBarGraph, ObjectType::GraphicsContext,
                                 ObjectType::ObjectPointer});
            }
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        // Data and alarm masks share everything but the input objects
        inline dp::Vector<ObjectType> mask(VTVersion version, bool with_inputs) {
            dp::Vector<ObjectType> allowed;
            allowed.push_back(ObjectType::Container);
            if (with_inputs) {
                append(allowed, {ObjectType::Button, ObjectType::InputBoolean, ObjectType::InputString,
                                 ObjectType::InputNumber, ObjectType::InputList});
            }
            append(allowed, {ObjectType::OutputString, ObjectType::OutputNumber, ObjectType::OutputLine,
                             ObjectType::OutputRectangle, ObjectType::OutputEllipse, ObjectType::OutputPolygon,
                             ObjectType::OutputMeter, ObjectType::OutputLinearBarGraph,
                             ObjectType::OutputArchedBarGraph, ObjectType::PictureGraphic, ObjectType::ObjectPointer});
            if (at_least(version, VTVersion::Version3))
                allowed.push_back(ObjectType::WorkingSet);
            if (at_least(version, VTVersion::Version4))
                append(allowed, {ObjectType::OutputList, ObjectType::GraphicsContext});
            if (at_least(version, VTVersion::Version5))
                append(allowed, {ObjectType::Animation, ObjectType::ExternalObjectPointer});
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        inline dp::Vector<ObjectType> data_mask(VTVersion version) { return mask(version, true); }
        inline dp::Vector<ObjectType> alarm_mask(VTVersion version) { return mask(version, false); }

        // As of VT version 6 a container accepts the same objects as a data mask
        inline dp::Vector<ObjectType> container(VTVersion version) { return data_mask(version); }

        inline dp::Vector<ObjectType> soft_key_mask(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            append(allowed, {ObjectType::Key, ObjectType::ObjectPointer});
            if (at_least(version, VTVersion::Version5))
                allowed.push_back(ObjectType::ExternalObjectPointer);
            return allowed;
        }

        inline dp::Vector<ObjectType> key(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            append(allowed, {ObjectType::Container, ObjectType::OutputString, ObjectType::OutputNumber,
                             ObjectType::OutputLine, ObjectType::OutputRectangle, ObjectType::OutputEllipse,
                             ObjectType::OutputPolygon, ObjectType::PictureGraphic, ObjectType::ObjectPointer});
            if (at_least(version, VTVersion::Version4)) {
                append(allowed, {ObjectType::WorkingSet, ObjectType::OutputList, ObjectType::OutputMeter,
                                 ObjectType::OutputLinearBarGraph, ObjectType::OutputArchedBarGraph,
                                 ObjectType::GraphicsContext});
            }
            if (at_least(version, VTVersion::Version5))
                append(allowed, {ObjectType::Animation, ObjectType::ExternalObjectPointer});
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        // As of VT version 6 a button accepts the same objects as a key
        inline dp::Vector<ObjectType> button(VTVersion version) { return key(version); }

        inline dp::Vector<ObjectType> input_list(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            append(allowed, {ObjectType::OutputString, ObjectType::OutputNumber, ObjectType::PictureGraphic});
            if (at_least(version, VTVersion::Version4)) {
                append(allowed, {ObjectType::WorkingSet, ObjectType::Container, ObjectType::OutputList,
                                 ObjectType::OutputLine, ObjectType::OutputRectangle, ObjectType::OutputEllipse,
                                 ObjectType::OutputPolygon, ObjectType::OutputMeter, ObjectType::OutputLinearBarGraph,
                                 ObjectType::OutputArchedBarGraph, ObjectType::GraphicsContext,
                                 ObjectType::ObjectPointer});
            }
            if (at_least(version, VTVersion::Version5))
                allowed.push_back(ObjectType::ExternalObjectPointer);
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        inline dp::Vector<ObjectType> window_mask(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            if (at_least(version, VTVersion::Version4)) {
                append(allowed, {ObjectType::WorkingSet, ObjectType::Container, ObjectType::Button,
                                 ObjectType::InputBoolean, ObjectType::InputString, ObjectType::InputNumber,
                                 ObjectType::InputList, ObjectType::OutputString, ObjectType::OutputNumber,
                                 ObjectType::OutputList, ObjectType::OutputLine, ObjectType::OutputRectangle,
                                 ObjectType::OutputEllipse, ObjectType::OutputPolygon, ObjectType::OutputMeter,
                                 ObjectType::OutputLinearBarGraph, ObjectType::OutputArchedBarGraph,
                                 ObjectType::GraphicsContext, ObjectType::PictureGraphic, ObjectType::ObjectPointer});
            }
            if (at_least(version, VTVersion::Version5))
                append(allowed, {ObjectType::Animation, ObjectType::ExternalObjectPointer});
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        // As of VT version 6 an output list accepts the same objects as a window mask
        inline dp::Vector<ObjectType> output_list(VTVersion version) { return window_mask(version); }

        inline dp::Vector<ObjectType> aux_function_1(VTVersion) {
            dp::Vector<ObjectType> allowed;
            append(allowed, {ObjectType::OutputString, ObjectType::OutputNumber, ObjectType::OutputLine,
                             ObjectType::OutputRectangle, ObjectType::OutputEllipse, ObjectType::OutputPolygon,
                             ObjectType::PictureGraphic});
            return allowed;
        }

        inline dp::Vector<ObjectType> aux_input_1(VTVersion version) { return aux_function_1(version); }

        inline dp::Vector<ObjectType> aux_function_2(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            if (at_least(version, VTVersion::Version3)) {
                append(allowed, {ObjectType::Container, ObjectType::OutputString, ObjectType::OutputNumber,
                                 ObjectType::OutputLine, ObjectType::OutputRectangle, ObjectType::OutputEllipse,
                                 ObjectType::OutputPolygon, ObjectType::OutputMeter, ObjectType::OutputLinearBarGraph,
                                 ObjectType::OutputArchedBarGraph, ObjectType::PictureGraphic,
                                 ObjectType::ObjectPointer});
            }
            if (at_least(version, VTVersion::Version4))
                append(allowed, {ObjectType::OutputList, ObjectType::GraphicsContext});
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        inline dp::Vector<ObjectType> aux_input_2(VTVersion version) { return aux_function_2(version); }

        inline dp::Vector<ObjectType> key_group(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            if (at_least(version, VTVersion::Version4))
                allowed.push_back(ObjectType::Key);
            return allowed;
        }

        inline dp::Vector<ObjectType> animation(VTVersion version) {
            dp::Vector<ObjectType> allowed;
            if (at_least(version, VTVersion::Version5)) {
                append(allowed, {ObjectType::Container, ObjectType::OutputString, ObjectType::OutputNumber,
                                 ObjectType::OutputList, ObjectType::OutputLine, ObjectType::OutputRectangle,
                                 ObjectType::OutputEllipse, ObjectType::OutputPolygon, ObjectType::OutputMeter,
                                 ObjectType::OutputLinearBarGraph, ObjectType::OutputArchedBarGraph,
                                 ObjectType::GraphicsContext, ObjectType::PictureGraphic, ObjectType::ObjectPointer});
            }
            if (at_least(version, VTVersion::Version6))
                allowed.push_back(ObjectType::ScaledGraphic);
            return allowed;
        }

        // The label list holds label records, not object references
        inline dp::Vector<ObjectType> object_label_reference_list(VTVersion) { return {}; }

    } // namespace schema

    inline dp::Vector<ObjectType> allowed_children(ObjectType type, VTVersion version) {
        switch (type) {
        case ObjectType::WorkingSet:
            return schema::working_set(version);
        case ObjectType::DataMask:
            return schema::data_mask(version);
        case ObjectType::AlarmMask:
            return schema::alarm_mask(version);
        case ObjectType::Container:
            return schema::container(version);
        case ObjectType::SoftKeyMask:
            return schema::soft_key_mask(version);
        case ObjectType::Key:
            return schema::key(version);
        case ObjectType::Button:
            return schema::button(version);
        case ObjectType::InputList:
            return schema::input_list(version);
        case ObjectType::OutputList:
            return schema::output_list(version);
        case ObjectType::AuxFunction1:
            return schema::aux_function_1(version);
        case ObjectType::AuxInput1:
            return schema::aux_input_1(version);
        case ObjectType::AuxFunction2:
            return schema::aux_function_2(version);
        case ObjectType::AuxInput2:
            return schema::aux_input_2(version);
        case ObjectType::WindowMask:
            return schema::window_mask(version);
        case ObjectType::KeyGroup:
            return schema::key_group(version);
        case ObjectType::Animation:
            return schema::animation(version);
        case ObjectType::ObjectLabelReferenceList:
            return schema::object_label_reference_list(version);
        default:
            return {};
        }
    }

    inline bool is_allowed_child(ObjectType parent, ObjectType child, VTVersion version) {
        for (auto t : allowed_children(parent, version)) {
            if (t == child)
                return true;
        }
        return false;
    }

    // Parents that list their children by id instead of by positioned reference
    inline bool uses_object_list(ObjectType type) noexcept {
        switch (type) {
        case ObjectType::SoftKeyMask:
        case ObjectType::KeyGroup:
        case ObjectType::InputList:
        case ObjectType::OutputList:
        case ObjectType::Animation:
        case ObjectType::ObjectLabelReferenceList:
            return true;
        default:
            return false;
        }
    }

    // Objects of the pool that may be picked as a child (or pointer target) of `parent_type`
    inline dp::Vector<const VTObject *> child_candidates(const ObjectPool &pool, ObjectType parent_type,
                                                        VTVersion version) {
        return pool.objects_by_types(allowed_children(parent_type, version));
    }

    // ─── Pool validation against the schema ──────────────────────────────────────
    struct RelationshipViolation {
        ObjectID parent = NULL_OBJECT_ID;
        ObjectID child = NULL_OBJECT_ID;
        ObjectType parent_type = ObjectType::WorkingSet;
        ObjectType child_type = ObjectType::WorkingSet;
    };

    // Unresolved ids are missing references, not schema violations, and are skipped
    inline dp::Vector<RelationshipViolation> find_illegal_children(const ObjectPool &pool, VTVersion version) {
        dp::Vector<RelationshipViolation> violations;
        for (const auto &obj : pool.objects()) {
            auto ids = obj.child_ids();
            if (ids.empty())
                continue;
            auto allowed = allowed_children(obj.type, version);
            for (auto child_id : ids) {
                const auto *child = pool.object_by_id(child_id);
                if (!child)
                    continue;
                bool ok = false;
                for (auto t : allowed) {
                    if (t == child->type) {
                        ok = true;
                        break;
                    }
                }
                if (!ok) {
                    violations.push_back({obj.id, child_id, obj.type, child->type});
                    echo::category("vtdesigner.vt.schema")
                        .debug(object_type_name(child->type), " ", child_id, " not allowed in ",
                               object_type_name(obj.type), " ", obj.id);
                }
            }
        }
        return violations;
    }

} // namespace vtdesigner::vt
namespace vtdesigner {
    using namespace vt;
}
