#pragma once

#include "objects.hpp"
#include <datapod/datapod.hpp>
#include <initializer_list>

namespace vtdesigner::vt {

    inline const char *event_name(Event event) noexcept {
        switch (event) {
        case Event::Reserved: return "Reserved";
        case Event::OnActivate: return "OnActivate";
        case Event::OnDeactivate: return "OnDeactivate";
        case Event::OnShow: return "OnShow";
        case Event::OnHide: return "OnHide";
        case Event::OnEnable: return "OnEnable";
        case Event::OnDisable: return "OnDisable";
        case Event::OnChangeActiveMask: return "OnChangeActiveMask";
        case Event::OnChangeSoftKeyMask: return "OnChangeSoftKeyMask";
        case Event::OnChangeAttribute: return "OnChangeAttribute";
        case Event::OnChangeBackgroundColour: return "OnChangeBackgroundColour";
        case Event::OnChangeFontAttributes: return "OnChangeFontAttributes";
        case Event::OnChangeLineAttributes: return "OnChangeLineAttributes";
        case Event::OnChangeFillAttributes: return "OnChangeFillAttributes";
        case Event::OnChangeChildLocation: return "OnChangeChildLocation";
        case Event::OnChangeSize: return "OnChangeSize";
        case Event::OnChangeValue: return "OnChangeValue";
        case Event::OnChangePriority: return "OnChangePriority";
        case Event::OnChangeEndPoint: return "OnChangeEndPoint";
        case Event::OnInputFieldSelection: return "OnInputFieldSelection";
        case Event::OnInputFieldDeselection: return "OnInputFieldDeselection";
        case Event::OnESC: return "OnESC";
        case Event::OnEntryOfValue: return "OnEntryOfValue";
        case Event::OnEntryOfNewValue: return "OnEntryOfNewValue";
        case Event::OnKeyPress: return "OnKeyPress";
        case Event::OnKeyRelease: return "OnKeyRelease";
        case Event::OnChangeChildPosition: return "OnChangeChildPosition";
        case Event::OnPointingEventPress: return "OnPointingEventPress";
        case Event::OnPointingEventRelease: return "OnPointingEventRelease";
        }
        return "Unknown";
    }

    // ─── Macro events an object can bind (ISO 11783-6 Table A.1) ─────────────────
    // OnRefresh is deliberately not offered for any object.
    inline dp::Vector<Event> possible_events(ObjectType type) {
        using E = Event;
        auto list = [](std::initializer_list<Event> events) { return dp::Vector<Event>(events); };

        switch (type) {
        case ObjectType::WorkingSet:
            return list({E::OnActivate, E::OnDeactivate, E::OnChangeActiveMask, E::OnChangeBackgroundColour,
                         E::OnChangeChildLocation, E::OnChangeChildPosition});
        case ObjectType::DataMask:
            return list({E::OnShow, E::OnHide, E::OnChangeBackgroundColour, E::OnChangeChildLocation,
                         E::OnChangeChildPosition, E::OnChangeSoftKeyMask, E::OnChangeAttribute,
                         E::OnPointingEventPress, E::OnPointingEventRelease});
        case ObjectType::AlarmMask:
            return list({E::OnShow, E::OnHide, E::OnChangeBackgroundColour, E::OnChangeChildLocation,
                         E::OnChangeChildPosition, E::OnChangePriority, E::OnChangeSoftKeyMask,
                         E::OnChangeAttribute});
        case ObjectType::Container:
            return list({E::OnShow, E::OnHide, E::OnChangeChildLocation, E::OnChangeChildPosition,
                         E::OnChangeSize});
        case ObjectType::SoftKeyMask:
            return list({E::OnShow, E::OnHide, E::OnChangeBackgroundColour, E::OnChangeAttribute});
        case ObjectType::Key:
            return list({E::OnKeyPress, E::OnKeyRelease, E::OnChangeBackgroundColour, E::OnChangeChildLocation,
                         E::OnChangeChildPosition, E::OnChangeAttribute, E::OnInputFieldSelection,
                         E::OnInputFieldDeselection});
        case ObjectType::Button:
            return list({E::OnEnable, E::OnDisable, E::OnInputFieldSelection, E::OnInputFieldDeselection,
                         E::OnKeyPress, E::OnKeyRelease, E::OnChangeBackgroundColour, E::OnChangeSize,
                         E::OnChangeChildLocation, E::OnChangeChildPosition, E::OnChangeAttribute});
        case ObjectType::InputBoolean:
        case ObjectType::InputString:
        case ObjectType::InputNumber:
            return list({E::OnEnable, E::OnDisable, E::OnInputFieldSelection, E::OnInputFieldDeselection, E::OnESC,
                         E::OnChangeBackgroundColour, E::OnChangeValue, E::OnEntryOfValue, E::OnEntryOfNewValue,
                         E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::InputList:
            return list({E::OnEnable, E::OnDisable, E::OnInputFieldSelection, E::OnInputFieldDeselection, E::OnESC,
                         E::OnChangeValue, E::OnEntryOfValue, E::OnEntryOfNewValue, E::OnChangeAttribute,
                         E::OnChangeSize});
        case ObjectType::OutputString:
        case ObjectType::OutputNumber:
            return list({E::OnChangeBackgroundColour, E::OnChangeValue, E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::OutputList:
        case ObjectType::OutputMeter:
        case ObjectType::OutputLinearBarGraph:
        case ObjectType::OutputArchedBarGraph:
            return list({E::OnChangeValue, E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::OutputLine:
            return list({E::OnChangeEndPoint, E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::OutputRectangle:
        case ObjectType::OutputEllipse:
            return list({E::OnChangeSize, E::OnChangeAttribute});
        case ObjectType::OutputPolygon:
            return list({E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::PictureGraphic:
        case ObjectType::KeyGroup:
        case ObjectType::ExternalObjectDefinition:
        case ObjectType::ExternalReferenceName:
            return list({E::OnChangeAttribute});
        case ObjectType::NumberVariable:
        case ObjectType::StringVariable:
        case ObjectType::InputAttributes:
        case ObjectType::ObjectPointer:
        case ObjectType::ExternalObjectPointer:
            return list({E::OnChangeValue});
        case ObjectType::FontAttributes:
            return list({E::OnChangeFontAttributes, E::OnChangeAttribute});
        case ObjectType::LineAttributes:
            return list({E::OnChangeLineAttributes, E::OnChangeAttribute});
        case ObjectType::FillAttributes:
            return list({E::OnChangeFillAttributes, E::OnChangeAttribute});
        case ObjectType::GraphicsContext:
            return list({E::OnChangeAttribute, E::OnChangeBackgroundColour});
        case ObjectType::WindowMask:
            return list({E::OnShow, E::OnHide, E::OnChangeBackgroundColour, E::OnChangeChildLocation,
                         E::OnChangeChildPosition, E::OnChangeAttribute, E::OnPointingEventPress,
                         E::OnPointingEventRelease});
        case ObjectType::Animation:
            return list({E::OnEnable, E::OnDisable, E::OnChangeValue, E::OnChangeAttribute, E::OnChangeSize});
        case ObjectType::ScaledGraphic:
            return list({E::OnChangeAttribute, E::OnChangeValue});
        default:
            return {};
        }
    }

    inline bool is_possible_event(ObjectType type, Event event) {
        for (auto e : possible_events(type)) {
            if (e == event)
                return true;
        }
        return false;
    }

} // namespace vtdesigner::vt
namespace vtdesigner {
    using namespace vt;
}
