/**
 * @file test_types.cpp
 * @brief Unit tests for type descriptors, struct layouts and morph::Any
 *
 * Tests cover:
 * - Descriptor kinds and display names
 * - Layout flattening of squashed and embedded fields
 * - Configuration errors raised while building a layout
 * - Empty checks and Any ownership states
 * - Concurrent decodes sharing one cached layout
 */

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "morph/Errors.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace morph;
using namespace fixtures;

namespace {

struct DuplicateNames {
    std::string A;
    std::string B;
};

void describe(StructBuilder<DuplicateNames>& b) {
    b.field("A", &DuplicateNames::A, "x");
    b.field("B", &DuplicateNames::B, "x");
}

struct BadRemain {
    std::string Extra;
};

void describe(StructBuilder<BadRemain>& b) {
    b.field("Extra", &BadRemain::Extra, ",remain");
}

struct IntKeyedRemain {
    std::map<int, Value> Extra;
};

void describe(StructBuilder<IntKeyedRemain>& b) {
    b.field("Extra", &IntKeyedRemain::Extra, ",remain");
}

struct TwoRemains {
    std::map<std::string, Value> First;
    std::map<std::string, Value> Second;
};

void describe(StructBuilder<TwoRemains>& b) {
    b.field("First", &TwoRemains::First, ",remain");
    b.field("Second", &TwoRemains::Second, ",remain");
}

struct SkippedDuplicate {
    std::string A;
    std::string B;
};

void describe(StructBuilder<SkippedDuplicate>& b) {
    b.field("A", &SkippedDuplicate::A, "x");
    b.field("B", &SkippedDuplicate::B, "-");
}

const FieldBinding* find_binding(const StructLayout& layout, const std::string& key) {
    for (const auto& binding : layout.bindings) {
        if (binding.key == key) return &binding;
    }
    return nullptr;
}

struct Pool {
    std::uint32_t Size = 0;
    double Timeout = 0.0;
};

void describe(StructBuilder<Pool>& b) {
    b.field("Size", &Pool::Size, "size");
    b.field("Timeout", &Pool::Timeout, "timeout");
}

// One instantiation per test so each starts from its own layout state
template <int Id>
struct Worker {
    std::string Name;
    Pool pool;
    std::map<std::string, Value> Extra;
};

template <int Id>
void describe(StructBuilder<Worker<Id>>& b) {
    b.field("Name", &Worker<Id>::Name, "name");
    b.embed("Pool", &Worker<Id>::pool, ",squash");
    b.field("Extra", &Worker<Id>::Extra, ",remain");
}

/**
 * @brief Decode into a fresh Worker from @p threads threads at once; count correct results
 */
template <int Id>
int decode_concurrently(int threads, int rounds) {
    std::atomic<int> ok{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&ok, &go, t, rounds] {
            while (!go.load()) std::this_thread::yield();
            for (int i = 0; i < rounds; ++i) {
                const std::string name = "w" + std::to_string(t) + "_" + std::to_string(i);
                Worker<Id> result;
                try {
                    decode(Value{{"name", name}, {"size", t}, {"timeout", 1.5}, {"zone", i}}, &result);
                } catch (const Error&) {
                    continue;
                }
                if (result.Name == name && result.pool.Size == static_cast<std::uint32_t>(t) &&
                    result.pool.Timeout == 1.5 && result.Extra.size() == 1 &&
                    result.Extra["zone"] == i) {
                    ++ok;
                }
            }
        });
    }

    go.store(true);
    for (auto& th : workers) th.join();
    return ok.load();
}

} // namespace

// ============================================================================
// Descriptor kinds and names
// ============================================================================

TEST(TypesTest, ScalarKindsAndNames) {
    EXPECT_EQ(type_of<bool>().kind(), Kind::Bool);
    EXPECT_EQ(type_of<std::int8_t>().name(), "int8");
    EXPECT_EQ(type_of<std::int32_t>().name(), "int32");
    EXPECT_EQ(type_of<std::int64_t>().kind(), Kind::Int);
    EXPECT_EQ(type_of<std::uint16_t>().name(), "uint16");
    EXPECT_EQ(type_of<std::uint64_t>().kind(), Kind::Uint);
    EXPECT_EQ(type_of<float>().name(), "float32");
    EXPECT_EQ(type_of<double>().name(), "float64");
    EXPECT_EQ(type_of<std::string>().name(), "string");
    EXPECT_EQ(type_of<Value>().kind(), Kind::Dynamic);
    EXPECT_EQ(type_of<Any>().kind(), Kind::Interface);
}

TEST(TypesTest, CompositeNames) {
    EXPECT_EQ((type_of<std::vector<std::string>>().name()), "[]string");
    EXPECT_EQ((type_of<std::array<int, 3>>().name()), "[3]int32");
    EXPECT_EQ((type_of<std::map<std::string, double>>().name()), "map[string]float64");
    EXPECT_EQ((type_of<std::unique_ptr<std::uint8_t>>().name()), "*uint8");
    EXPECT_EQ((type_of<std::optional<bool>>().kind()), Kind::Pointer);
    EXPECT_EQ(type_of<Basic>().kind(), Kind::Struct);
    EXPECT_NE(type_of<Basic>().name().find("Basic"), std::string::npos);
}

TEST(TypesTest, DescriptorIsUniquePerType) {
    EXPECT_EQ(&type_of<Basic>(), &type_of<Basic>());
    EXPECT_EQ(&type_of<const int>(), &type_of<int>());
    EXPECT_NE(&type_of<int>(), &type_of<unsigned>());
}

// ============================================================================
// Layouts
// ============================================================================

TEST(LayoutTest, OwnFieldsSkipHiddenMembers) {
    const auto& layout = static_cast<const StructType&>(type_of<Basic>()).layout();
    EXPECT_EQ(layout.fields.size(), 16u);
    EXPECT_EQ(layout.bindings.size(), 15u);
    EXPECT_EQ(find_binding(layout, "vsilent"), nullptr);
    EXPECT_FALSE(layout.remain.has_value());
}

TEST(LayoutTest, SquashPromotesInnerFields) {
    const auto& layout = static_cast<const StructType&>(type_of<EmbeddedSquash>()).layout();

    const auto* vstring = find_binding(layout, "Vstring");
    ASSERT_NE(vstring, nullptr);
    ASSERT_EQ(vstring->route.size(), 2u);
    EXPECT_EQ(vstring->route[0]->name, "Basic");
    EXPECT_EQ(vstring->field().name, "Vstring");

    // Squashed fields are not reachable by their own name
    EXPECT_EQ(find_binding(layout, "Basic"), nullptr);
    EXPECT_NE(find_binding(layout, "Vunique"), nullptr);
}

TEST(LayoutTest, UntaggedEmbedAlsoAnswersToItsName) {
    const auto& layout = static_cast<const StructType&>(type_of<Embedded>()).layout();

    EXPECT_EQ(layout.bindings.size(), 17u);
    const auto* alias = find_binding(layout, "Basic");
    ASSERT_NE(alias, nullptr);
    EXPECT_TRUE(alias->alias);
    EXPECT_EQ(alias->route.size(), 1u);
    EXPECT_EQ(layout.bindings[15].key, "Basic");
    EXPECT_EQ(layout.bindings[16].key, "Vunique");
}

TEST(LayoutTest, TaggedNamesAreEffectiveKeys) {
    const auto& layout = static_cast<const StructType&>(type_of<Tagged>()).layout();
    ASSERT_EQ(layout.bindings.size(), 2u);
    EXPECT_EQ(layout.bindings[0].key, "bar");
    EXPECT_EQ(layout.bindings[1].key, "foo");
}

TEST(LayoutTest, RemainFieldIsRecorded) {
    const auto& layout = static_cast<const StructType&>(type_of<Remainder>()).layout();
    ASSERT_TRUE(layout.remain.has_value());
    EXPECT_EQ(layout.bindings[*layout.remain].field().name, "Extra");
}

// ============================================================================
// Configuration errors
// ============================================================================

TEST(ConfigurationErrorTest, SquashOnNonStruct) {
    const auto& type = static_cast<const StructType&>(type_of<SquashOnNonStructType>());
    try {
        type.layout();
        FAIL() << "expected InvalidSquashTarget";
    } catch (const InvalidSquashTarget& e) {
        EXPECT_EQ(e.field(), "InvalidSquashType");
        EXPECT_NE(std::string(e.what()).find("unsupported type for squash"), std::string::npos);
    }

    // Not cached: every use reports it again
    EXPECT_THROW(type.layout(), InvalidSquashTarget);
}

TEST(ConfigurationErrorTest, DuplicateDeclaredNames) {
    EXPECT_THROW(static_cast<const StructType&>(type_of<DuplicateNames>()).layout(), DuplicateFieldName);
}

TEST(ConfigurationErrorTest, SkippedFieldDoesNotCollide) {
    EXPECT_NO_THROW(static_cast<const StructType&>(type_of<SkippedDuplicate>()).layout());
}

TEST(ConfigurationErrorTest, RemainNeedsStringKeyedMapping) {
    EXPECT_THROW(static_cast<const StructType&>(type_of<BadRemain>()).layout(), InvalidRemainTarget);
    EXPECT_THROW(static_cast<const StructType&>(type_of<IntKeyedRemain>()).layout(), InvalidRemainTarget);
}

TEST(ConfigurationErrorTest, AtMostOneRemainField) {
    EXPECT_THROW(static_cast<const StructType&>(type_of<TwoRemains>()).layout(), MultipleRemainFields);
}

TEST(ConfigurationErrorTest, DecodeAbortsOnConfigurationError) {
    SquashOnNonStructType result;
    EXPECT_THROW(decode(Value::parse(R"({"InvalidSquashType": 1})"), &result), ConfigurationError);
}

// ============================================================================
// Empty checks
// ============================================================================

TEST(TypesTest, IsEmpty) {
    int zero = 0;
    int one = 1;
    std::string text;
    std::vector<int> list;
    std::shared_ptr<int> ptr;
    std::optional<int> opt = 0;
    Any any;
    Basic basic;

    EXPECT_TRUE(type_of<int>().is_empty(&zero));
    EXPECT_FALSE(type_of<int>().is_empty(&one));
    EXPECT_TRUE(type_of<std::string>().is_empty(&text));
    EXPECT_TRUE(type_of<std::vector<int>>().is_empty(&list));
    EXPECT_TRUE(type_of<std::shared_ptr<int>>().is_empty(&ptr));
    EXPECT_FALSE(type_of<std::optional<int>>().is_empty(&opt));
    EXPECT_TRUE(type_of<Any>().is_empty(&any));
    EXPECT_FALSE(type_of<Basic>().is_empty(&basic));
}

// ============================================================================
// Any
// ============================================================================

TEST(AnyTest, States) {
    Any empty;
    EXPECT_EQ(empty.state(), Any::State::Empty);
    EXPECT_EQ(empty.type(), nullptr);

    auto inner = std::make_shared<Basic>();
    Any ref = Any::ref(inner);
    EXPECT_EQ(ref.state(), Any::State::Reference);
    EXPECT_EQ(ref.get_if<Basic>(), inner.get());

    Any held = Any::of(42);
    EXPECT_EQ(held.state(), Any::State::Holding);
    ASSERT_NE(held.get_if<int>(), nullptr);
    EXPECT_EQ(*held.get_if<int>(), 42);
    EXPECT_EQ(held.get_if<std::string>(), nullptr);

    Any null_ref = Any::ref(std::shared_ptr<Basic>());
    EXPECT_TRUE(null_ref.empty());
}

TEST(AnyTest, CopyOfHeldValueIsIndependent) {
    Any original = Any::of(std::string("foo"));
    Any copy = original;
    *copy.get_if<std::string>() = "bar";
    EXPECT_EQ(*original.get_if<std::string>(), "foo");
}

TEST(AnyTest, CopyOfReferenceSharesTarget) {
    auto inner = std::make_shared<int>(1);
    Any original = Any::ref(inner);
    Any copy = original;
    *copy.get_if<int>() = 7;
    EXPECT_EQ(*inner, 7);
}

TEST(AnyTest, MoveLeavesSourceEmpty) {
    Any original = Any::of(3);
    Any moved = std::move(original);
    EXPECT_EQ(moved.state(), Any::State::Holding);
    EXPECT_TRUE(original.empty());  // NOLINT(bugprone-use-after-move)
}

TEST(AnyTest, HoldsDynamicValue) {
    Any any(Value::parse(R"({"a": 1})"));
    ASSERT_NE(any.value(), nullptr);
    EXPECT_EQ((*any.value())["a"], 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(ConcurrencyTest, DecodesShareCachedLayout) {
    const auto& type = static_cast<const StructType&>(type_of<Worker<1>>());
    const StructLayout& layout = type.layout();

    EXPECT_EQ(decode_concurrently<1>(8, 200), 8 * 200);
    EXPECT_EQ(&type.layout(), &layout);
}

TEST(ConcurrencyTest, FirstLayoutBuildRaces) {
    EXPECT_EQ(decode_concurrently<2>(8, 50), 8 * 50);

    const auto& type = static_cast<const StructType&>(type_of<Worker<2>>());
    EXPECT_EQ(type.layout().bindings.size(), 4u);
    ASSERT_TRUE(type.layout().remain.has_value());
}
