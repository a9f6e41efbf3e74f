#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <initializer_list>

namespace vtdesigner::vt {

    // ─── VT Object types (ISO 11783-6 Table A.2) ─────────────────────────────────
    enum class ObjectType : u8 {
        WorkingSet = 0,
        DataMask = 1,
        AlarmMask = 2,
        Container = 3,
        SoftKeyMask = 4,
        Key = 5,
        Button = 6,
        InputBoolean = 7,
        InputString = 8,
        InputNumber = 9,
        InputList = 10,
        OutputString = 11,
        OutputNumber = 12,
        OutputLine = 13,
        OutputRectangle = 14,
        OutputEllipse = 15,
        OutputPolygon = 16,
        OutputMeter = 17,
        OutputLinearBarGraph = 18,
        OutputArchedBarGraph = 19,
        PictureGraphic = 20,
        NumberVariable = 21,
        StringVariable = 22,
        FontAttributes = 23,
        LineAttributes = 24,
        FillAttributes = 25,
        InputAttributes = 26,
        ObjectPointer = 27,
        Macro = 28,
        AuxFunction1 = 29,
        AuxInput1 = 30,
        AuxFunction2 = 31,
        AuxInput2 = 32,
        AuxControlDesignator2 = 33,
        WindowMask = 34,
        KeyGroup = 35,
        GraphicsContext = 36,
        OutputList = 37,
        ExtendedInputAttributes = 38,
        ColourMap = 39,
        ObjectLabelReferenceList = 40,
        ExternalObjectDefinition = 41,
        ExternalReferenceName = 42,
        ExternalObjectPointer = 43,
        Animation = 44,
        ColourPalette = 45,
        GraphicData = 46,
        WorkingSetSpecialControls = 47,
        ScaledGraphic = 48
    };

    inline constexpr u8 OBJECT_TYPE_COUNT = 49;

    inline constexpr bool is_valid_object_type(u8 raw) noexcept { return raw < OBJECT_TYPE_COUNT; }

    // Every object type in wire order, for pickers and exhaustive checks
    inline dp::Vector<ObjectType> all_object_types() {
        dp::Vector<ObjectType> types;
        for (u8 i = 0; i < OBJECT_TYPE_COUNT; ++i)
            types.push_back(static_cast<ObjectType>(i));
        return types;
    }

    // Identifier-style name, used by the default "{id}: {type}" display name
    inline const char *object_type_name(ObjectType type) noexcept {
        switch (type) {
        case ObjectType::WorkingSet: return "WorkingSet";
        case ObjectType::DataMask: return "DataMask";
        case ObjectType::AlarmMask: return "AlarmMask";
        case ObjectType::Container: return "Container";
        case ObjectType::SoftKeyMask: return "SoftKeyMask";
        case ObjectType::Key: return "Key";
        case ObjectType::Button: return "Button";
        case ObjectType::InputBoolean: return "InputBoolean";
        case ObjectType::InputString: return "InputString";
        case ObjectType::InputNumber: return "InputNumber";
        case ObjectType::InputList: return "InputList";
        case ObjectType::OutputString: return "OutputString";
        case ObjectType::OutputNumber: return "OutputNumber";
        case ObjectType::OutputLine: return "OutputLine";
        case ObjectType::OutputRectangle: return "OutputRectangle";
        case ObjectType::OutputEllipse: return "OutputEllipse";
        case ObjectType::OutputPolygon: return "OutputPolygon";
        case ObjectType::OutputMeter: return "OutputMeter";
        case ObjectType::OutputLinearBarGraph: return "OutputLinearBarGraph";
        case ObjectType::OutputArchedBarGraph: return "OutputArchedBarGraph";
        case ObjectType::PictureGraphic: return "PictureGraphic";
        case ObjectType::NumberVariable: return "NumberVariable";
        case ObjectType::StringVariable: return "StringVariable";
        case ObjectType::FontAttributes: return "FontAttributes";
        case ObjectType::LineAttributes: return "LineAttributes";
        case ObjectType::FillAttributes: return "FillAttributes";
        case ObjectType::InputAttributes: return "InputAttributes";
        case ObjectType::ObjectPointer: return "ObjectPointer";
        case ObjectType::Macro: return "Macro";
        case ObjectType::AuxFunction1: return "AuxiliaryFunctionType1";
        case ObjectType::AuxInput1: return "AuxiliaryInputType1";
        case ObjectType::AuxFunction2: return "AuxiliaryFunctionType2";
        case ObjectType::AuxInput2: return "AuxiliaryInputType2";
        case ObjectType::AuxControlDesignator2: return "AuxiliaryControlDesignatorType2";
        case ObjectType::WindowMask: return "WindowMask";
        case ObjectType::KeyGroup: return "KeyGroup";
        case ObjectType::GraphicsContext: return "GraphicsContext";
        case ObjectType::OutputList: return "OutputList";
        case ObjectType::ExtendedInputAttributes: return "ExtendedInputAttributes";
        case ObjectType::ColourMap: return "ColourMap";
        case ObjectType::ObjectLabelReferenceList: return "ObjectLabelReferenceList";
        case ObjectType::ExternalObjectDefinition: return "ExternalObjectDefinition";
        case ObjectType::ExternalReferenceName: return "ExternalReferenceName";
        case ObjectType::ExternalObjectPointer: return "ExternalObjectPointer";
        case ObjectType::Animation: return "Animation";
        case ObjectType::ColourPalette: return "ColourPalette";
        case ObjectType::GraphicData: return "GraphicData";
        case ObjectType::WorkingSetSpecialControls: return "WorkingSetSpecialControls";
        case ObjectType::ScaledGraphic: return "ScaledGraphic";
        }
        return "Unknown";
    }

    // ─── VT version ──────────────────────────────────────────────────────────────
    enum class VTVersion : u8 { Version2 = 2, Version3 = 3, Version4 = 4, Version5 = 5, Version6 = 6 };

    inline constexpr bool at_least(VTVersion version, VTVersion minimum) noexcept {
        return static_cast<u8>(version) >= static_cast<u8>(minimum);
    }

    // ─── Macro events (ISO 11783-6 Table A.1) ────────────────────────────────────
    enum class Event : u8 {
        Reserved = 0,
        OnActivate = 1,
        OnDeactivate = 2,
        OnShow = 3,
        OnHide = 4,
        OnEnable = 5,
        OnDisable = 6,
        OnChangeActiveMask = 7,
        OnChangeSoftKeyMask = 8,
        OnChangeAttribute = 9,
        OnChangeBackgroundColour = 10,
        OnChangeFontAttributes = 11,
        OnChangeLineAttributes = 12,
        OnChangeFillAttributes = 13,
        OnChangeChildLocation = 14,
        OnChangeSize = 15,
        OnChangeValue = 16,
        OnChangePriority = 17,
        OnChangeEndPoint = 18,
        OnInputFieldSelection = 19,
        OnInputFieldDeselection = 20,
        OnESC = 21,
        OnEntryOfValue = 22,
        OnEntryOfNewValue = 23,
        OnKeyPress = 24,
        OnKeyRelease = 25,
        OnChangeChildPosition = 26,
        OnPointingEventPress = 27,
        OnPointingEventRelease = 28
    };

    // ─── Reference value types ───────────────────────────────────────────────────
    struct NullableObjectID {
        ObjectID value = NULL_OBJECT_ID;

        constexpr NullableObjectID() = default;
        constexpr NullableObjectID(ObjectID id) : value(id) {}

        static constexpr NullableObjectID none() noexcept { return NullableObjectID{}; }

        constexpr bool is_null() const noexcept { return value == NULL_OBJECT_ID; }
        constexpr bool operator==(const NullableObjectID &other) const noexcept { return value == other.value; }
    };

    // Positioned child reference: child id plus pixel offset inside the parent
    struct ObjectRef {
        ObjectID id = NULL_OBJECT_ID;
        Point offset{};

        constexpr bool operator==(const ObjectRef &other) const noexcept {
            return id == other.id && offset == other.offset;
        }
    };

    struct MacroRef {
        Event event = Event::Reserved;
        ObjectID macro_id = NULL_OBJECT_ID;

        constexpr bool operator==(const MacroRef &other) const noexcept {
            return event == other.event && macro_id == other.macro_id;
        }
    };

    // Which attribute of the owner a single-object reference fills
    enum class FieldRole : u8 {
        ActiveMask = 0,
        SoftKeyMask = 1,
        FontAttributes = 2,
        LineAttributes = 3,
        FillAttributes = 4,
        InputAttributes = 5,
        Variable = 6,
        TargetValueVariable = 7,
        Value = 8, // Object Pointer target
        Name = 9,
        WindowTitle = 10,
        WindowIcon = 11,
        KeyGroupIcon = 12,
        FillPattern = 13,
        ExternalReferenceName = 14,
        ExternalObject = 15
    };

    struct ObjectField {
        FieldRole role = FieldRole::Value;
        NullableObjectID id{};

        constexpr bool operator==(const ObjectField &other) const noexcept {
            return role == other.role && id == other.id;
        }
    };

    namespace detail {
        template <typename T> bool equal_lists(const dp::Vector<T> &a, const dp::Vector<T> &b) {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
        }
    } // namespace detail

    // ─── VT Object ───────────────────────────────────────────────────────────────
    // One node of the pool graph. The kind-specific attribute bytes that the
    // editor core never interprets travel in `attributes`.
    struct VTObject {
        ObjectID id = 0;
        ObjectType type = ObjectType::WorkingSet;
        u16 width = 0;
        u16 height = 0;
        u8 key_code = 0;
        dp::Vector<ObjectRef> object_refs;
        dp::Vector<ObjectID> object_list;
        dp::Vector<ObjectField> fields;
        dp::Vector<MacroRef> macros;
        dp::Vector<u8> attributes;

        // Fluent setters
        VTObject &set_id(ObjectID v) {
            id = v;
            return *this;
        }
        VTObject &set_type(ObjectType v) {
            type = v;
            return *this;
        }
        VTObject &set_size(u16 w, u16 h) {
            width = w;
            height = h;
            return *this;
        }
        VTObject &set_key_code(u8 v) {
            key_code = v;
            return *this;
        }
        VTObject &add_child(ObjectID child, i16 x = 0, i16 y = 0) {
            object_refs.push_back(ObjectRef{child, Point{x, y}});
            return *this;
        }
        VTObject &set_object_list(std::initializer_list<ObjectID> ids) {
            object_list = dp::Vector<ObjectID>(ids);
            return *this;
        }
        VTObject &add_list_item(ObjectID v) {
            object_list.push_back(v);
            return *this;
        }
        VTObject &add_macro(Event event, ObjectID macro_id) {
            macros.push_back(MacroRef{event, macro_id});
            return *this;
        }
        VTObject &set_attributes(std::initializer_list<u8> bytes) {
            attributes = dp::Vector<u8>(bytes);
            return *this;
        }

        // Setting a null id keeps the role present so the wire layout stays stable
        VTObject &set_field(FieldRole role, NullableObjectID target) {
            for (auto &f : fields) {
                if (f.role == role) {
                    f.id = target;
                    return *this;
                }
            }
            fields.push_back(ObjectField{role, target});
            return *this;
        }

        NullableObjectID field(FieldRole role) const noexcept {
            for (const auto &f : fields) {
                if (f.role == role)
                    return f.id;
            }
            return NullableObjectID::none();
        }

        // Ids governed by the relationship schema: positioned children and list entries
        dp::Vector<ObjectID> child_ids() const {
            dp::Vector<ObjectID> ids;
            for (const auto &ref : object_refs)
                ids.push_back(ref.id);
            for (auto item : object_list) {
                if (item != NULL_OBJECT_ID)
                    ids.push_back(item);
            }
            return ids;
        }

        // Every outgoing edge except macro bindings, in display order
        dp::Vector<ObjectID> referenced_objects() const {
            auto ids = child_ids();
            for (const auto &f : fields) {
                if (!f.id.is_null())
                    ids.push_back(f.id.value);
            }
            return ids;
        }

        bool references(ObjectID target) const {
            for (auto id : referenced_objects()) {
                if (id == target)
                    return true;
            }
            return false;
        }

        bool operator==(const VTObject &other) const {
            return id == other.id && type == other.type && width == other.width && height == other.height &&
                   key_code == other.key_code && detail::equal_lists(object_refs, other.object_refs) &&
                   detail::equal_lists(object_list, other.object_list) && detail::equal_lists(fields, other.fields) &&
                   detail::equal_lists(macros, other.macros) && detail::equal_lists(attributes, other.attributes);
        }
        bool operator!=(const VTObject &other) const { return !(*this == other); }
    };

} // namespace vtdesigner::vt
namespace vtdesigner {
    using namespace vt;
}
