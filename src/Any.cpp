/**
 * @file Any.cpp
 * @brief Implementation of the interface-typed target
 */

#include "morph/Any.hpp"

namespace morph {

Any::Any(Value value)
    : state_(State::Holding)
    , type_(&type_of<Value>())
    , data_(std::make_shared<Value>(std::move(value)))
{}

Any::Any(const Any& other)
    : state_(other.state_)
    , type_(other.type_)
{
    if (state_ == State::Holding) {
        // Held values are owned: copy them
        data_ = type_->create();
        type_->assign(data_.get(), other.data_.get());
    } else {
        data_ = other.data_;
    }
}

Any::Any(Any&& other) noexcept
    : state_(other.state_)
    , type_(other.type_)
    , data_(std::move(other.data_))
{
    other.state_ = State::Empty;
    other.type_ = nullptr;
}

Any& Any::operator=(Any&& other) noexcept {
    if (this != &other) {
        state_ = other.state_;
        type_ = other.type_;
        data_ = std::move(other.data_);
        other.state_ = State::Empty;
        other.type_ = nullptr;
    }
    return *this;
}

Any& Any::operator=(const Any& other) {
    if (this != &other) {
        Any copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Any Any::adopt(const TypeInfo& type, std::shared_ptr<void> data) {
    Any any;
    if (data) {
        any.state_ = State::Holding;
        any.type_ = &type;
        any.data_ = std::move(data);
    }
    return any;
}

void Any::reset() noexcept {
    state_ = State::Empty;
    type_ = nullptr;
    data_.reset();
}

bool InterfaceType::is_empty(const void* obj) const {
    return static_cast<const Any*>(obj)->empty();
}

} // namespace morph
