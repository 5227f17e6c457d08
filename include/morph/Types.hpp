/**
 * @file Types.hpp
 * @brief Static type descriptors for decode targets
 *
 * Every decodable C++ type is represented by exactly one TypeInfo, obtained
 * through type_of<T>() (see Reflect.hpp). The decoder never inspects C++
 * types directly: it dispatches on TypeInfo::kind() and manipulates storage
 * through the type-erased operations declared here.
 *
 * Shapes:
 * - Bool, Int, Uint, Float, String: scalars
 * - Struct: registered record with named fields
 * - Sequence: growable list (std::vector)
 * - Array: fixed-length list (std::array)
 * - Mapping: keyed container (std::map, std::unordered_map)
 * - Pointer: optional indirection (unique_ptr, shared_ptr, optional)
 * - Interface: morph::Any
 * - Dynamic: morph::Value, accepts any source as-is
 */

#ifndef MORPH_TYPES_HPP
#define MORPH_TYPES_HPP

#include "morph/Tag.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace morph {

/**
 * @brief Static kind of a decode target
 */
enum class Kind {
    Bool,
    Int,
    Uint,
    Float,
    String,
    Struct,
    Sequence,
    Array,
    Mapping,
    Pointer,
    Interface,
    Dynamic
};

/**
 * @brief Descriptor of one C++ type
 *
 * Instances live for the whole process and are never copied.
 */
class TypeInfo {
public:
    virtual ~TypeInfo() = default;

    TypeInfo(const TypeInfo&) = delete;
    TypeInfo& operator=(const TypeInfo&) = delete;

    Kind kind() const noexcept { return kind_; }

    /**
     * @brief Display name used in error messages (e.g. "int32", "[]string")
     */
    const std::string& name() const noexcept { return name_; }

    /**
     * @brief Allocate a default-constructed instance
     */
    virtual std::shared_ptr<void> create() const = 0;

    /**
     * @brief Copy-assign @p src into @p dst
     * @throws std::logic_error if the type is not copyable
     */
    virtual void assign(void* dst, const void* src) const = 0;

    /**
     * @brief Move-assign @p src into @p dst
     */
    virtual void move_assign(void* dst, void* src) const = 0;

    /**
     * @brief Reset @p obj to its zero value
     */
    virtual void reset(void* obj) const = 0;

    /**
     * @brief Zero number, false, empty string/container, null pointer, empty Any
     *
     * Structs are never empty.
     */
    virtual bool is_empty(const void* obj) const = 0;

protected:
    TypeInfo(Kind kind, std::string name)
        : kind_(kind)
        , name_(std::move(name))
    {}

private:
    Kind kind_;
    std::string name_;
};

class BoolType : public TypeInfo {
public:
    virtual bool load(const void* obj) const = 0;
    virtual void store(void* obj, bool value) const = 0;

protected:
    explicit BoolType(std::string name) : TypeInfo(Kind::Bool, std::move(name)) {}
};

/**
 * @brief Signed integer of 8, 16, 32 or 64 bits
 */
class IntType : public TypeInfo {
public:
    int bits() const noexcept { return bits_; }

    virtual std::int64_t load(const void* obj) const = 0;
    virtual void store(void* obj, std::int64_t value) const = 0;

protected:
    IntType(std::string name, int bits) : TypeInfo(Kind::Int, std::move(name)), bits_(bits) {}

private:
    int bits_;
};

/**
 * @brief Unsigned integer of 8, 16, 32 or 64 bits
 */
class UintType : public TypeInfo {
public:
    int bits() const noexcept { return bits_; }

    virtual std::uint64_t load(const void* obj) const = 0;
    virtual void store(void* obj, std::uint64_t value) const = 0;

protected:
    UintType(std::string name, int bits) : TypeInfo(Kind::Uint, std::move(name)), bits_(bits) {}

private:
    int bits_;
};

class FloatType : public TypeInfo {
public:
    int bits() const noexcept { return bits_; }

    virtual double load(const void* obj) const = 0;
    virtual void store(void* obj, double value) const = 0;

protected:
    FloatType(std::string name, int bits) : TypeInfo(Kind::Float, std::move(name)), bits_(bits) {}

private:
    int bits_;
};

/**
 * @brief One registered member of a struct
 */
struct FieldInfo {
    /// Declared member name
    std::string name;
    /// Raw annotation string
    std::string tag;
    FieldSpec spec;
    /// Registered with StructBuilder::embed
    bool anonymous = false;
    const TypeInfo* type = nullptr;
    std::function<void*(void*)> access;
    std::function<const void*(const void*)> access_const;
};

/**
 * @brief A field reachable from a struct's name-resolution namespace
 *
 * route holds the chain of embedded fields walked to reach the field,
 * ending with the field itself. Own fields have a route of length one.
 */
struct FieldBinding {
    std::vector<const FieldInfo*> route;
    /// Effective name: declared name if present, member name otherwise
    std::string key;
    /// Untagged embedded field reachable by its own name next to its promoted fields
    bool alias = false;

    const FieldInfo& field() const noexcept { return *route.back(); }
};

/**
 * @brief Cached decode plan of a struct type
 */
struct StructLayout {
    /// Own fields in registration order
    std::vector<FieldInfo> fields;
    /// Flattened, promotion-resolved fields in decode order
    std::vector<FieldBinding> bindings;
    /// Index into bindings of the remainder field, if any
    std::optional<std::size_t> remain;
};

class StructType : public TypeInfo {
public:
    /**
     * @brief Get the field layout, building it on first use
     *
     * The layout is built once per type and is read-only afterwards.
     *
     * @throws ConfigurationError for invalid squash/remain usage or
     *         duplicate declared names (thrown again on every call)
     */
    const StructLayout& layout() const;

protected:
    explicit StructType(std::string name) : TypeInfo(Kind::Struct, std::move(name)) {}

    /**
     * @brief Run the type's registration and return its own fields
     */
    virtual std::vector<FieldInfo> describe_fields() const = 0;

private:
    std::unique_ptr<StructLayout> build_layout() const;

    mutable std::mutex mutex_;
    mutable std::unique_ptr<StructLayout> owned_;
    mutable std::atomic<const StructLayout*> layout_{nullptr};
};

class SequenceType : public TypeInfo {
public:
    const TypeInfo& element() const noexcept { return element_; }

    virtual std::size_t size(const void* obj) const = 0;
    virtual void resize(void* obj, std::size_t n) const = 0;
    virtual void* at(void* obj, std::size_t i) const = 0;
    virtual const void* at(const void* obj, std::size_t i) const = 0;

protected:
    SequenceType(std::string name, const TypeInfo& element)
        : TypeInfo(Kind::Sequence, std::move(name)), element_(element) {}

private:
    const TypeInfo& element_;
};

class ArrayType : public TypeInfo {
public:
    const TypeInfo& element() const noexcept { return element_; }
    std::size_t length() const noexcept { return length_; }

    virtual void* at(void* obj, std::size_t i) const = 0;
    virtual const void* at(const void* obj, std::size_t i) const = 0;

protected:
    ArrayType(std::string name, const TypeInfo& element, std::size_t length)
        : TypeInfo(Kind::Array, std::move(name)), element_(element), length_(length) {}

private:
    const TypeInfo& element_;
    std::size_t length_;
};

class MapType : public TypeInfo {
public:
    const TypeInfo& key() const noexcept { return key_; }
    const TypeInfo& value() const noexcept { return value_; }

    virtual std::size_t size(const void* obj) const = 0;
    virtual void clear(void* obj) const = 0;

    /**
     * @brief Move @p key and @p value into the map, replacing an existing entry
     */
    virtual void insert(void* obj, void* key, void* value) const = 0;

    virtual void for_each(const void* obj,
                          const std::function<void(const void* key, const void* value)>& fn) const = 0;

protected:
    MapType(std::string name, const TypeInfo& key, const TypeInfo& value)
        : TypeInfo(Kind::Mapping, std::move(name)), key_(key), value_(value) {}

private:
    const TypeInfo& key_;
    const TypeInfo& value_;
};

class PointerType : public TypeInfo {
public:
    const TypeInfo& pointee() const noexcept { return pointee_; }

    /**
     * @brief Get the pointee, or nullptr when the pointer is empty
     */
    virtual void* get(void* obj) const = 0;
    virtual const void* get(const void* obj) const = 0;

    /**
     * @brief Point at a fresh default-constructed pointee and return it
     */
    virtual void* allocate(void* obj) const = 0;

    /**
     * @brief Point at a fresh pointee move-constructed from @p value
     */
    virtual void adopt(void* obj, void* value) const = 0;

    virtual void clear(void* obj) const = 0;

protected:
    PointerType(std::string name, const TypeInfo& pointee)
        : TypeInfo(Kind::Pointer, std::move(name)), pointee_(pointee) {}

private:
    const TypeInfo& pointee_;
};

/**
 * @brief Struct type reachable by squashing a field of type @p type
 * @return The struct itself, the pointee of a pointer to struct, or nullptr
 */
const StructType* squash_target(const TypeInfo& type) noexcept;

/**
 * @brief Whether the fields of @p field are promoted into its parent
 *
 * True for `squash` fields and for untagged embedded structs.
 */
bool promotes(const FieldInfo& field) noexcept;

} // namespace morph

#endif // MORPH_TYPES_HPP
