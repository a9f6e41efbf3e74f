#pragma once

#include "../core/constants.hpp"
#include "objects.hpp"

namespace vtdesigner::vt {

    // ─── Default objects for the "add object" action ─────────────────────────────
    // Sizes are starting points the operator resizes afterwards. Nullable
    // attribute references start out NULL.
    inline VTObject default_object(ObjectType type) {
        VTObject obj;
        obj.type = type;
        obj.id = 0;

        switch (type) {
        case ObjectType::WorkingSet:
            obj.set_field(FieldRole::ActiveMask, NullableObjectID::none());
            break;
        case ObjectType::DataMask:
        case ObjectType::AlarmMask:
            obj.set_field(FieldRole::SoftKeyMask, NullableObjectID::none());
            break;
        case ObjectType::Container:
            obj.set_size(100, 100);
            break;
        case ObjectType::Button:
            obj.set_size(100, 40);
            break;
        case ObjectType::InputBoolean:
            obj.set_size(20, 20);
            obj.set_field(FieldRole::FontAttributes, NullableObjectID::none());
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            break;
        case ObjectType::InputString:
        case ObjectType::InputNumber:
            obj.set_size(100, 20);
            obj.set_field(FieldRole::FontAttributes, NullableObjectID::none());
            obj.set_field(FieldRole::InputAttributes, NullableObjectID::none());
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            break;
        case ObjectType::InputList:
        case ObjectType::OutputList:
            obj.set_size(100, 20);
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            break;
        case ObjectType::OutputString:
        case ObjectType::OutputNumber:
            obj.set_size(100, 20);
            obj.set_field(FieldRole::FontAttributes, NullableObjectID::none());
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            break;
        case ObjectType::OutputLine:
            obj.set_size(50, 50);
            obj.set_field(FieldRole::LineAttributes, NullableObjectID::none());
            break;
        case ObjectType::OutputRectangle:
        case ObjectType::OutputEllipse:
        case ObjectType::OutputPolygon:
            obj.set_size(50, 50);
            obj.set_field(FieldRole::LineAttributes, NullableObjectID::none());
            obj.set_field(FieldRole::FillAttributes, NullableObjectID::none());
            break;
        case ObjectType::OutputMeter:
        case ObjectType::OutputArchedBarGraph:
            obj.set_size(100, 100);
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            break;
        case ObjectType::OutputLinearBarGraph:
            obj.set_size(20, 100);
            obj.set_field(FieldRole::Variable, NullableObjectID::none());
            obj.set_field(FieldRole::TargetValueVariable, NullableObjectID::none());
            break;
        case ObjectType::PictureGraphic:
        case ObjectType::ScaledGraphic:
        case ObjectType::Animation:
            obj.set_size(50, 50);
            break;
        case ObjectType::GraphicsContext:
            obj.set_size(100, 100);
            break;
        case ObjectType::ObjectPointer:
        case ObjectType::ExternalObjectPointer:
            obj.set_field(FieldRole::Value, NullableObjectID::none());
            break;
        case ObjectType::WindowMask:
            obj.set_field(FieldRole::Name, NullableObjectID::none());
            obj.set_field(FieldRole::WindowTitle, NullableObjectID::none());
            obj.set_field(FieldRole::WindowIcon, NullableObjectID::none());
            break;
        case ObjectType::KeyGroup:
            obj.set_field(FieldRole::Name, NullableObjectID::none());
            obj.set_field(FieldRole::KeyGroupIcon, NullableObjectID::none());
            break;
        default:
            break;
        }
        return obj;
    }

} // namespace vtdesigner::vt
namespace vtdesigner {
    using namespace vt;
}
