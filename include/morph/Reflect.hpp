/**
 * @file Reflect.hpp
 * @brief Type descriptor registry and struct registration
 *
 * type_of<T>() maps a C++ type to its process-wide TypeInfo. Structs opt in
 * by providing a `describe` function that ADL can find next to the type:
 *
 * ```cpp
 * struct Basic {
 *     std::string Vstring;
 *     int Vint = 0;
 *     bool vsilent = false;
 * };
 *
 * void describe(morph::StructBuilder<Basic>& b) {
 *     b.field("Vstring", &Basic::Vstring);
 *     b.field("Vint", &Basic::Vint, "vint,omitempty");
 *     b.hidden("vsilent", &Basic::vsilent);
 * }
 *
 * struct Embedded {
 *     Basic Basic;
 *     std::string Vunique;
 * };
 *
 * void describe(morph::StructBuilder<Embedded>& b) {
 *     b.embed("Basic", &Embedded::Basic, ",squash");
 *     b.field("Vunique", &Embedded::Vunique);
 * }
 * ```
 *
 * `describe` runs lazily, the first time the decoder needs the layout of
 * the struct, so self-referential types (through pointers, sequences or
 * mappings) are fine.
 */

#ifndef MORPH_REFLECT_HPP
#define MORPH_REFLECT_HPP

#include "morph/Types.hpp"
#include "morph/Value.hpp"

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace morph {

class Any;
class InterfaceType;

template <typename T>
const TypeInfo& type_of();

/**
 * @brief Readable name of a C++ type (demangled where supported)
 */
std::string demangle(const char* mangled);

template <typename T>
std::string type_name() {
    return demangle(typeid(T).name());
}

/**
 * @brief Collects the fields of struct @p T during registration
 */
template <typename T>
class StructBuilder {
public:
    explicit StructBuilder(std::vector<FieldInfo>& fields) : fields_(fields) {}

    /**
     * @brief Register a named field
     * @param name Declared member name, matched case-insensitively by default
     * @param member Pointer to the member
     * @param tag Annotation: `name[,option...]` or `-`
     */
    template <typename M>
    StructBuilder& field(std::string name, M T::*member, const std::string& tag = "") {
        add(std::move(name), member, tag, false, true);
        return *this;
    }

    /**
     * @brief Register an embedded (anonymous) field
     *
     * Without a tag, an embedded struct or pointer to struct has its fields
     * promoted into this struct and stays reachable by its own name.
     */
    template <typename M>
    StructBuilder& embed(std::string name, M T::*member, const std::string& tag = "") {
        add(std::move(name), member, tag, true, true);
        return *this;
    }

    /**
     * @brief Register an unexported field; it is never matched, populated or encoded
     */
    template <typename M>
    StructBuilder& hidden(std::string name, M T::*member) {
        add(std::move(name), member, "", false, false);
        return *this;
    }

private:
    template <typename M>
    void add(std::string name, M T::*member, const std::string& tag, bool anonymous, bool exported) {
        FieldInfo info;
        info.name = std::move(name);
        info.tag = tag;
        info.spec = parse_tag(tag);
        info.spec.exported = exported;
        info.anonymous = anonymous;
        info.type = &type_of<M>();
        info.access = [member](void* obj) -> void* {
            return &(static_cast<T*>(obj)->*member);
        };
        info.access_const = [member](const void* obj) -> const void* {
            return &(static_cast<const T*>(obj)->*member);
        };
        fields_.push_back(std::move(info));
    }

    std::vector<FieldInfo>& fields_;
};

namespace detail {

/**
 * @brief Storage operations shared by every concrete descriptor of @p T
 */
template <typename T, typename Base>
class TypeImpl : public Base {
public:
    template <typename... Args>
    explicit TypeImpl(Args&&... args) : Base(std::forward<Args>(args)...) {}

    std::shared_ptr<void> create() const override {
        return std::make_shared<T>();
    }

    void assign(void* dst, const void* src) const override {
        if constexpr (std::is_copy_assignable_v<T>) {
            *static_cast<T*>(dst) = *static_cast<const T*>(src);
        } else {
            throw std::logic_error("type " + this->name() + " is not copyable");
        }
    }

    void move_assign(void* dst, void* src) const override {
        *static_cast<T*>(dst) = std::move(*static_cast<T*>(src));
    }

    void reset(void* obj) const override {
        *static_cast<T*>(obj) = T{};
    }

protected:
    static T& self(void* obj) { return *static_cast<T*>(obj); }
    static const T& self(const void* obj) { return *static_cast<const T*>(obj); }
};

class BoolTypeImpl final : public TypeImpl<bool, BoolType> {
public:
    BoolTypeImpl() : TypeImpl("bool") {}
    bool load(const void* obj) const override { return self(obj); }
    void store(void* obj, bool value) const override { self(obj) = value; }
    bool is_empty(const void* obj) const override { return !self(obj); }
};

template <typename T>
class IntTypeImpl final : public TypeImpl<T, IntType> {
public:
    IntTypeImpl() : TypeImpl<T, IntType>("int" + std::to_string(sizeof(T) * 8), static_cast<int>(sizeof(T) * 8)) {}
    std::int64_t load(const void* obj) const override { return this->self(obj); }
    void store(void* obj, std::int64_t value) const override { this->self(obj) = static_cast<T>(value); }
    bool is_empty(const void* obj) const override { return this->self(obj) == 0; }
};

template <typename T>
class UintTypeImpl final : public TypeImpl<T, UintType> {
public:
    UintTypeImpl() : TypeImpl<T, UintType>("uint" + std::to_string(sizeof(T) * 8), static_cast<int>(sizeof(T) * 8)) {}
    std::uint64_t load(const void* obj) const override { return this->self(obj); }
    void store(void* obj, std::uint64_t value) const override { this->self(obj) = static_cast<T>(value); }
    bool is_empty(const void* obj) const override { return this->self(obj) == 0; }
};

template <typename T>
class FloatTypeImpl final : public TypeImpl<T, FloatType> {
public:
    FloatTypeImpl() : TypeImpl<T, FloatType>("float" + std::to_string(sizeof(T) * 8), static_cast<int>(sizeof(T) * 8)) {}
    double load(const void* obj) const override { return this->self(obj); }
    void store(void* obj, double value) const override { this->self(obj) = static_cast<T>(value); }
    bool is_empty(const void* obj) const override { return this->self(obj) == 0; }
};

class StringType final : public TypeImpl<std::string, TypeInfo> {
public:
    StringType() : TypeImpl(Kind::String, "string") {}
    bool is_empty(const void* obj) const override { return self(obj).empty(); }
};

class DynamicType final : public TypeImpl<Value, TypeInfo> {
public:
    DynamicType() : TypeImpl(Kind::Dynamic, "value") {}
    bool is_empty(const void* obj) const override {
        const auto& v = self(obj);
        return v.is_null() || (is_container(v) && v.empty());
    }
};

template <typename T>
class StructTypeImpl final : public TypeImpl<T, StructType> {
public:
    StructTypeImpl() : TypeImpl<T, StructType>(type_name<T>()) {}
    bool is_empty(const void*) const override { return false; }

protected:
    std::vector<FieldInfo> describe_fields() const override {
        std::vector<FieldInfo> fields;
        StructBuilder<T> builder(fields);
        describe(builder);
        return fields;
    }
};

template <typename T>
class SequenceTypeImpl final : public TypeImpl<T, SequenceType> {
public:
    using Element = typename T::value_type;

    SequenceTypeImpl()
        : TypeImpl<T, SequenceType>("[]" + type_of<Element>().name(), type_of<Element>()) {}

    std::size_t size(const void* obj) const override { return this->self(obj).size(); }
    void resize(void* obj, std::size_t n) const override { this->self(obj).resize(n); }
    void* at(void* obj, std::size_t i) const override { return &this->self(obj)[i]; }
    const void* at(const void* obj, std::size_t i) const override { return &this->self(obj)[i]; }
    bool is_empty(const void* obj) const override { return this->self(obj).empty(); }
};

template <typename T, std::size_t N>
class ArrayTypeImpl final : public TypeImpl<std::array<T, N>, ArrayType> {
public:
    ArrayTypeImpl()
        : TypeImpl<std::array<T, N>, ArrayType>(
              "[" + std::to_string(N) + "]" + type_of<T>().name(), type_of<T>(), N) {}

    void* at(void* obj, std::size_t i) const override { return &this->self(obj)[i]; }
    const void* at(const void* obj, std::size_t i) const override { return &this->self(obj)[i]; }
    bool is_empty(const void*) const override { return N == 0; }
};

template <typename T>
class MapTypeImpl final : public TypeImpl<T, MapType> {
public:
    using Key = typename T::key_type;
    using Mapped = typename T::mapped_type;

    MapTypeImpl()
        : TypeImpl<T, MapType>("map[" + type_of<Key>().name() + "]" + type_of<Mapped>().name(),
                               type_of<Key>(), type_of<Mapped>()) {}

    std::size_t size(const void* obj) const override { return this->self(obj).size(); }
    void clear(void* obj) const override { this->self(obj).clear(); }

    void insert(void* obj, void* key, void* value) const override {
        this->self(obj).insert_or_assign(std::move(*static_cast<Key*>(key)),
                                         std::move(*static_cast<Mapped*>(value)));
    }

    void for_each(const void* obj,
                  const std::function<void(const void*, const void*)>& fn) const override {
        for (const auto& [k, v] : this->self(obj)) {
            fn(&k, &v);
        }
    }

    bool is_empty(const void* obj) const override { return this->self(obj).empty(); }
};

/**
 * @brief Pointer shapes: unique_ptr, shared_ptr, optional
 */
template <typename P>
struct PointerTraits;

template <typename T>
struct PointerTraits<std::unique_ptr<T>> {
    using Element = T;
    static T* get(std::unique_ptr<T>& p) { return p.get(); }
    static const T* get(const std::unique_ptr<T>& p) { return p.get(); }
    static T* emplace(std::unique_ptr<T>& p, T&& v) { p = std::make_unique<T>(std::move(v)); return p.get(); }
};

template <typename T>
struct PointerTraits<std::shared_ptr<T>> {
    using Element = T;
    static T* get(std::shared_ptr<T>& p) { return p.get(); }
    static const T* get(const std::shared_ptr<T>& p) { return p.get(); }
    static T* emplace(std::shared_ptr<T>& p, T&& v) { p = std::make_shared<T>(std::move(v)); return p.get(); }
};

template <typename T>
struct PointerTraits<std::optional<T>> {
    using Element = T;
    static T* get(std::optional<T>& p) { return p ? &*p : nullptr; }
    static const T* get(const std::optional<T>& p) { return p ? &*p : nullptr; }
    static T* emplace(std::optional<T>& p, T&& v) { return &p.emplace(std::move(v)); }
};

template <typename P>
class PointerTypeImpl final : public TypeImpl<P, PointerType> {
public:
    using Traits = PointerTraits<P>;
    using Element = typename Traits::Element;

    PointerTypeImpl() : TypeImpl<P, PointerType>("*" + type_of<Element>().name(), type_of<Element>()) {}

    void* get(void* obj) const override { return Traits::get(this->self(obj)); }
    const void* get(const void* obj) const override { return Traits::get(this->self(obj)); }
    void* allocate(void* obj) const override { return Traits::emplace(this->self(obj), Element{}); }
    void adopt(void* obj, void* value) const override {
        Traits::emplace(this->self(obj), std::move(*static_cast<Element*>(value)));
    }
    void clear(void* obj) const override { this->self(obj) = P{}; }
    bool is_empty(const void* obj) const override { return Traits::get(this->self(obj)) == nullptr; }
};

template <typename T, typename = void>
struct has_describe : std::false_type {};

template <typename T>
struct has_describe<T, std::void_t<decltype(describe(std::declval<StructBuilder<T>&>()))>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_signed_int_v =
    std::is_integral_v<T> && std::is_signed_v<T> && !std::is_same_v<T, bool>;

template <typename T>
inline constexpr bool is_unsigned_int_v =
    std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>;

/**
 * @brief Maps a C++ type to its concrete descriptor class
 */
template <typename T, typename Enable = void>
struct TypeOf {
    static_assert(sizeof(T) == 0,
                  "morph: unsupported target type; provide describe(StructBuilder<T>&) for structs");
};

template <>
struct TypeOf<bool> { using type = BoolTypeImpl; };

template <typename T>
struct TypeOf<T, std::enable_if_t<is_signed_int_v<T>>> { using type = IntTypeImpl<T>; };

template <typename T>
struct TypeOf<T, std::enable_if_t<is_unsigned_int_v<T>>> { using type = UintTypeImpl<T>; };

template <typename T>
struct TypeOf<T, std::enable_if_t<std::is_floating_point_v<T>>> { using type = FloatTypeImpl<T>; };

template <>
struct TypeOf<std::string> { using type = StringType; };

template <>
struct TypeOf<Value> { using type = DynamicType; };

template <>
struct TypeOf<Any> { using type = InterfaceType; };

template <typename T, typename A>
struct TypeOf<std::vector<T, A>> { using type = SequenceTypeImpl<std::vector<T, A>>; };

template <typename T, std::size_t N>
struct TypeOf<std::array<T, N>> { using type = ArrayTypeImpl<T, N>; };

template <typename K, typename V, typename C, typename A>
struct TypeOf<std::map<K, V, C, A>> { using type = MapTypeImpl<std::map<K, V, C, A>>; };

template <typename K, typename V, typename H, typename E, typename A>
struct TypeOf<std::unordered_map<K, V, H, E, A>> {
    using type = MapTypeImpl<std::unordered_map<K, V, H, E, A>>;
};

template <typename T>
struct TypeOf<std::unique_ptr<T>> { using type = PointerTypeImpl<std::unique_ptr<T>>; };

template <typename T>
struct TypeOf<std::shared_ptr<T>> { using type = PointerTypeImpl<std::shared_ptr<T>>; };

template <typename T>
struct TypeOf<std::optional<T>> { using type = PointerTypeImpl<std::optional<T>>; };

template <typename T>
struct TypeOf<T, std::enable_if_t<std::conjunction_v<std::is_class<T>, has_describe<T>>>> {
    using type = StructTypeImpl<T>;
};

} // namespace detail

/**
 * @brief Process-wide descriptor of @p T
 *
 * Built on first call (thread-safe) and never destroyed before exit.
 */
template <typename T>
const TypeInfo& type_of() {
    if constexpr (!std::is_same_v<T, std::remove_cv_t<T>>) {
        return type_of<std::remove_cv_t<T>>();
    } else {
        static const typename detail::TypeOf<T>::type info;
        return info;
    }
}

} // namespace morph

#endif // MORPH_REFLECT_HPP
