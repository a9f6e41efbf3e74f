#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../vt/object_pool.hpp"
#include "../vt/objects.hpp"
#include "object_info.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace vtdesigner::editor {

    // User-facing label for an object type
    inline const char *object_type_label(vt::ObjectType type) noexcept {
        using vt::ObjectType;
        switch (type) {
        case ObjectType::WorkingSet: return "Working Set";
        case ObjectType::DataMask: return "Data Mask";
        case ObjectType::AlarmMask: return "Alarm Screen";
        case ObjectType::Container: return "Container";
        case ObjectType::SoftKeyMask: return "Soft Key Mask";
        case ObjectType::Key: return "Key";
        case ObjectType::Button: return "Button";
        case ObjectType::InputBoolean: return "Checkbox";
        case ObjectType::InputString: return "Text Input";
        case ObjectType::InputNumber: return "Number Input";
        case ObjectType::InputList: return "List Input";
        case ObjectType::OutputString: return "Text Display";
        case ObjectType::OutputNumber: return "Number Display";
        case ObjectType::OutputList: return "List Display";
        case ObjectType::OutputLine: return "Line";
        case ObjectType::OutputRectangle: return "Rectangle";
        case ObjectType::OutputEllipse: return "Ellipse";
        case ObjectType::OutputPolygon: return "Polygon";
        case ObjectType::OutputMeter: return "Meter";
        case ObjectType::OutputLinearBarGraph: return "Linear Bar";
        case ObjectType::OutputArchedBarGraph: return "Arched Bar";
        case ObjectType::PictureGraphic: return "Picture";
        case ObjectType::NumberVariable: return "Number Variable";
        case ObjectType::StringVariable: return "String Variable";
        case ObjectType::FontAttributes: return "Font Style";
        case ObjectType::LineAttributes: return "Line Style";
        case ObjectType::FillAttributes: return "Fill Style";
        case ObjectType::InputAttributes: return "Input Style";
        case ObjectType::ObjectPointer: return "Object Reference";
        case ObjectType::Macro: return "Macro";
        case ObjectType::AuxFunction1: return "Aux Function v1";
        case ObjectType::AuxInput1: return "Aux Input v1";
        case ObjectType::AuxFunction2: return "Aux Function v2";
        case ObjectType::AuxInput2: return "Aux Input v2";
        case ObjectType::AuxControlDesignator2: return "Aux Control v2";
        case ObjectType::ColourMap: return "Colour Map";
        case ObjectType::GraphicsContext: return "Graphics Context";
        case ObjectType::ColourPalette: return "Colour Palette";
        case ObjectType::GraphicData: return "Graphic Data";
        case ObjectType::WorkingSetSpecialControls: return "Special Controls";
        case ObjectType::ScaledGraphic: return "Scaled Graphic";
        case ObjectType::WindowMask: return "Window Mask";
        case ObjectType::KeyGroup: return "Key Group";
        case ObjectType::ExtendedInputAttributes: return "Extended Input Style";
        case ObjectType::ObjectLabelReferenceList: return "Label Reference List";
        case ObjectType::ExternalObjectDefinition: return "External Object Definition";
        case ObjectType::ExternalReferenceName: return "External Reference Name";
        case ObjectType::ExternalObjectPointer: return "External Object Pointer";
        case ObjectType::Animation: return "Animation";
        }
        return "Object";
    }

    // ─── Displayed-name multiset ─────────────────────────────────────────────────
    class NameRegistry {
        dp::Map<dp::String, usize> counts_;

      public:
        // Every object's current display name (custom name, else the default)
        static NameRegistry from_pool(const vt::ObjectPool &pool, const ObjectInfoTable &info) {
            NameRegistry registry;
            for (const auto &obj : pool.objects())
                registry.add(info.display_name(obj));
            return registry;
        }

        void add(const dp::String &name) { counts_[name]++; }

        void remove(const dp::String &name) {
            auto it = counts_.find(name);
            if (it == counts_.end())
                return;
            if (it->second <= 1)
                counts_.erase(it);
            else
                it->second--;
        }

        usize count(const dp::String &name) const {
            auto it = counts_.find(name);
            return it != counts_.end() ? it->second : 0;
        }

        bool contains(const dp::String &name) const { return count(name) > 0; }
    };

    // `base` if nobody displays it yet, else "{base} {n}" for the first free n >= 2
    inline dp::String make_unique_name(const dp::String &base, const NameRegistry &registry) {
        if (!registry.contains(base))
            return base;
        for (u32 n = 2;; ++n) {
            dp::String candidate = base + " " + dp::String(std::to_string(n));
            if (!registry.contains(candidate))
                return candidate;
        }
    }

    // ─── Contextual names ────────────────────────────────────────────────────────
    // Derived from the object's own properties. No uniqueness check.
    inline dp::Optional<dp::String> generate_contextual_name(const vt::VTObject &object, const vt::ObjectPool &) {
        switch (object.type) {
        case vt::ObjectType::Key:
            if (object.key_code == 0)
                return dp::String("ACK/Enter Key");
            if (object.key_code == 1)
                return dp::String("ESC Key");
            if (object.key_code >= 2 && object.key_code <= 7)
                return "Soft Key " + dp::String(std::to_string(object.key_code - 1));
            return dp::nullopt;
        case vt::ObjectType::Button:
            if (object.key_code == 0)
                return dp::String("OK Button");
            if (object.key_code == 1)
                return dp::String("Cancel Button");
            return dp::nullopt;
        case vt::ObjectType::Container:
            if (object.height < 100)
                return dp::String("Header Container");
            if (object.height > 300)
                return dp::String("Main Container");
            return dp::nullopt;
        default:
            return dp::nullopt;
        }
    }

    // ─── Smart default names ─────────────────────────────────────────────────────
    // `ordinal` is the number of objects of the same type that come before this
    // one (for a new object: the count already in the pool).
    inline dp::String generate_smart_default_name(vt::ObjectType type, usize ordinal, const NameRegistry &registry) {
        dp::String base;
        if (type == vt::ObjectType::DataMask)
            base = ordinal == 0 ? "Main Screen" : "Data Screen";
        else
            base = object_type_label(type);

        if (ordinal == 0 && !registry.contains(base))
            return base;

        for (usize counter = ordinal + 1;; ++counter) {
            dp::String candidate = base + " " + dp::String(std::to_string(counter));
            if (!registry.contains(candidate))
                return candidate;
        }
    }

    // Name proposal for a child about to be created inside `parent`
    inline dp::Optional<dp::String> suggest_name_for_child(const vt::VTObject &parent, vt::ObjectType child_type,
                                                           const vt::ObjectPool &pool) {
        auto count_children = [&](vt::ObjectType type) {
            usize n = 0;
            for (auto id : parent.child_ids()) {
                const auto *obj = pool.object_by_id(id);
                if (obj && obj->type == type)
                    n++;
            }
            return n;
        };

        if (parent.type == vt::ObjectType::SoftKeyMask && child_type == vt::ObjectType::Key)
            return "F" + dp::String(std::to_string(count_children(vt::ObjectType::Key) + 1)) + " Key";
        if (parent.type == vt::ObjectType::Container && child_type == vt::ObjectType::Button)
            return dp::String("Container Button");
        if (parent.type == vt::ObjectType::Container && child_type == vt::ObjectType::OutputString)
            return dp::String("Container Label");
        if (parent.type == vt::ObjectType::DataMask && child_type == vt::ObjectType::Container) {
            switch (count_children(vt::ObjectType::Container)) {
            case 0: return dp::String("Header Container");
            case 1: return dp::String("Main Container");
            case 2: return dp::String("Footer Container");
            default: return dp::nullopt;
            }
        }
        return dp::nullopt;
    }

    // ─── Name validation ─────────────────────────────────────────────────────────
    inline Result<void> validate_name(const dp::String &name, const NameRegistry &registry) {
        bool blank = true;
        for (char c : name) {
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                blank = false;
                break;
            }
        }
        if (blank)
            return Result<void>::err(Error::invalid_name("name cannot be empty"));
        if (name.size() > MAX_NAME_LENGTH) {
            return Result<void>::err(Error::invalid_name("name is too long (max " +
                                                         dp::String(std::to_string(MAX_NAME_LENGTH)) + " characters)"));
        }
        if (registry.contains(name)) {
            return Result<void>::err(Error::invalid_name("name '" + name + "' already exists, try '" +
                                                         make_unique_name(name, registry) + "'"));
        }
        return {};
    }

    // ─── Batch naming ────────────────────────────────────────────────────────────
    // Names every listed object that has no custom name, or whose custom name is
    // also displayed by another object. Afterwards no two objects of the pool
    // display the same string among the listed ones and the rest. Returns the
    // number of objects that received a name.
    inline usize apply_smart_naming(const vt::ObjectPool &pool, ObjectInfoTable &info,
                                    const dp::Vector<ObjectID> &ids) {
        auto registry = NameRegistry::from_pool(pool, info);

        // Ordinal of each object among its type, in pool order
        dp::Map<ObjectID, usize> ordinals;
        dp::Map<u8, usize> seen;
        for (const auto &obj : pool.objects())
            ordinals[obj.id] = seen[static_cast<u8>(obj.type)]++;

        usize named = 0;
        for (auto id : ids) {
            const auto *obj = pool.object_by_id(id);
            if (!obj)
                continue;

            auto &entry = info.get_or_create(*obj);
            auto current = entry.get_name(*obj);
            if (entry.has_name() && registry.count(current) == 1)
                continue;

            registry.remove(current);
            dp::String name;
            auto contextual = generate_contextual_name(*obj, pool);
            if (contextual.has_value())
                name = make_unique_name(*contextual, registry);
            else
                name = generate_smart_default_name(obj->type, ordinals[obj->id], registry);

            entry.set_name(name);
            registry.add(name);
            named++;
            echo::category("vtdesigner.editor.naming").trace("object ", id, " named '", name, "'");
        }

        echo::category("vtdesigner.editor.naming").debug("named ", named, " of ", ids.size(), " objects");
        return named;
    }

} // namespace vtdesigner::editor
namespace vtdesigner {
    using namespace editor;
}
