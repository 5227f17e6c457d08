/**
 * @file Any.hpp
 * @brief Interface-typed decode target
 *
 * An Any is in exactly one of three states, and the decoder treats them
 * differently:
 * - Empty: a non-nil source is stored as-is (a copy of the Value)
 * - Reference: the decoder writes into the referenced object in place
 * - Holding: the decoder works on a copy of the held value and replaces
 *   the held value only if decoding that copy produced no errors
 *
 * A nil source clears the Any back to Empty.
 *
 * ```cpp
 * auto inner = std::make_shared<Basic>();
 * morph::Any a = morph::Any::ref(inner);   // decode mutates *inner
 * morph::Any b = morph::Any::of(Basic{});  // decode replaces the held Basic
 * morph::Any c;                            // decode stores the source Value
 * ```
 */

#ifndef MORPH_ANY_HPP
#define MORPH_ANY_HPP

#include "morph/Reflect.hpp"
#include "morph/Value.hpp"

#include <memory>

namespace morph {

class Any {
public:
    enum class State {
        Empty,
        Reference,
        Holding
    };

    Any() noexcept = default;

    /**
     * @brief Hold a dynamic value
     */
    explicit Any(Value value);

    Any(const Any& other);
    Any(Any&& other) noexcept;
    Any& operator=(const Any& other);
    Any& operator=(Any&& other) noexcept;

    /**
     * @brief Reference an existing object; a null @p target yields an empty Any
     */
    template <typename T>
    static Any ref(std::shared_ptr<T> target) {
        Any any;
        if (target) {
            any.state_ = State::Reference;
            any.type_ = &type_of<T>();
            any.data_ = std::move(target);
        }
        return any;
    }

    /**
     * @brief Hold @p value by value
     */
    template <typename T>
    static Any of(T value) {
        return adopt(type_of<T>(), std::make_shared<T>(std::move(value)));
    }

    /**
     * @brief Hold an already allocated instance of @p type
     */
    static Any adopt(const TypeInfo& type, std::shared_ptr<void> data);

    State state() const noexcept { return state_; }
    bool empty() const noexcept { return state_ == State::Empty; }

    /**
     * @brief Type of the referenced or held object, nullptr when empty
     */
    const TypeInfo* type() const noexcept { return type_; }

    void* data() noexcept { return data_.get(); }
    const void* data() const noexcept { return data_.get(); }

    template <typename T>
    T* get_if() noexcept {
        return type_ == &type_of<T>() ? static_cast<T*>(data_.get()) : nullptr;
    }

    template <typename T>
    const T* get_if() const noexcept {
        return type_ == &type_of<T>() ? static_cast<const T*>(data_.get()) : nullptr;
    }

    /**
     * @brief Held dynamic value, nullptr if the Any holds something else
     */
    const Value* value() const noexcept { return get_if<Value>(); }

    void reset() noexcept;

private:
    State state_ = State::Empty;
    const TypeInfo* type_ = nullptr;
    std::shared_ptr<void> data_;
};

/**
 * @brief Descriptor of morph::Any
 */
class InterfaceType final : public detail::TypeImpl<Any, TypeInfo> {
public:
    InterfaceType() : TypeImpl(Kind::Interface, "interface") {}
    bool is_empty(const void* obj) const override;
};

} // namespace morph

#endif // MORPH_ANY_HPP
