/**
 * @file Types.cpp
 * @brief Struct layout construction and descriptor helpers
 */

#include "morph/Types.hpp"
#include "morph/Reflect.hpp"
#include "morph/Errors.hpp"
#include "morph/Log.hpp"

#include <cstdlib>
#include <set>

#if defined(__GNUG__)
  #include <cxxabi.h>
#endif

namespace morph {

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> readable(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && readable) {
        return readable.get();
    }
#endif
    return mangled;
}

const StructType* squash_target(const TypeInfo& type) noexcept {
    if (type.kind() == Kind::Struct) {
        return static_cast<const StructType*>(&type);
    }
    if (type.kind() == Kind::Pointer) {
        const auto& pointee = static_cast<const PointerType&>(type).pointee();
        if (pointee.kind() == Kind::Struct) {
            return static_cast<const StructType*>(&pointee);
        }
    }
    return nullptr;
}

bool promotes(const FieldInfo& field) noexcept {
    if (field.spec.squash) return true;
    return field.anonymous && field.tag.empty() && squash_target(*field.type) != nullptr;
}

namespace {
    bool is_remain_target(const TypeInfo& type) {
        return type.kind() == Kind::Mapping &&
               static_cast<const MapType&>(type).key().kind() == Kind::String;
    }
}

const StructLayout& StructType::layout() const {
    if (const auto* built = layout_.load(std::memory_order_acquire)) {
        return *built;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto* built = layout_.load(std::memory_order_relaxed)) {
        return *built;
    }

    owned_ = build_layout();
    layout_.store(owned_.get(), std::memory_order_release);
    return *owned_;
}

std::unique_ptr<StructLayout> StructType::build_layout() const {
    auto layout = std::make_unique<StructLayout>();
    layout->fields = describe_fields();

    // Annotation checks run before anything is promoted
    std::set<std::string> declared;
    for (const auto& field : layout->fields) {
        if (field.spec.skip || !field.spec.exported) continue;

        if (field.spec.name && !declared.insert(*field.spec.name).second) {
            throw DuplicateFieldName(name(), field.name, *field.spec.name);
        }
        if (field.spec.squash && squash_target(*field.type) == nullptr) {
            throw InvalidSquashTarget(name(), field.name, field.type->name());
        }
        if (field.spec.remain && !is_remain_target(*field.type)) {
            throw InvalidRemainTarget(name(), field.name, field.type->name());
        }
    }

    for (const auto& field : layout->fields) {
        if (field.spec.skip || !field.spec.exported) continue;

        if (!promotes(field)) {
            FieldBinding binding;
            binding.route.push_back(&field);
            binding.key = field.spec.name.value_or(field.name);
            layout->bindings.push_back(std::move(binding));
            continue;
        }

        const auto& inner = squash_target(*field.type)->layout();
        for (const auto& inner_binding : inner.bindings) {
            FieldBinding promoted;
            promoted.route.reserve(inner_binding.route.size() + 1);
            promoted.route.push_back(&field);
            promoted.route.insert(promoted.route.end(),
                                  inner_binding.route.begin(), inner_binding.route.end());
            promoted.key = inner_binding.key;
            promoted.alias = inner_binding.alias;
            layout->bindings.push_back(std::move(promoted));
        }

        if (!field.spec.squash) {
            // Untagged embedding: the embedded struct also answers to its own name,
            // after its promoted fields so that a nested mapping wins.
            FieldBinding self;
            self.route.push_back(&field);
            self.key = field.name;
            self.alias = true;
            layout->bindings.push_back(std::move(self));
        }
    }

    for (std::size_t i = 0; i < layout->bindings.size(); ++i) {
        const auto& field = layout->bindings[i].field();
        if (!field.spec.remain) continue;
        if (layout->remain) {
            throw MultipleRemainFields(name(), field.name);
        }
        layout->remain = i;
    }

    logger()->debug("built layout for {}: {} fields, {} bindings{}",
                    name(), layout->fields.size(), layout->bindings.size(),
                    layout->remain ? ", with remainder" : "");
    return layout;
}

} // namespace morph
