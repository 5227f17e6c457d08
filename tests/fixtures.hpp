/**
 * @file fixtures.hpp
 * @brief Target types shared by the decoder tests
 */

#ifndef MORPH_TESTS_FIXTURES_HPP
#define MORPH_TESTS_FIXTURES_HPP

#include "morph/Any.hpp"
#include "morph/Decoder.hpp"
#include "morph/Reflect.hpp"
#include "morph/Value.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fixtures {

using morph::StructBuilder;
using morph::Value;

struct Basic {
    std::string Vstring;
    int Vint = 0;
    std::int8_t Vint8 = 0;
    std::int16_t Vint16 = 0;
    std::int32_t Vint32 = 0;
    std::int64_t Vint64 = 0;
    unsigned Vuint = 0;
    bool Vbool = false;
    double Vfloat = 0.0;
    std::string Vextra;
    bool vsilent = false;
    morph::Any Vdata;
    int VjsonInt = 0;
    unsigned VjsonUint = 0;
    std::uint64_t VjsonUint64 = 0;
    double VjsonFloat = 0.0;
};

inline void describe(StructBuilder<Basic>& b) {
    b.field("Vstring", &Basic::Vstring);
    b.field("Vint", &Basic::Vint);
    b.field("Vint8", &Basic::Vint8);
    b.field("Vint16", &Basic::Vint16);
    b.field("Vint32", &Basic::Vint32);
    b.field("Vint64", &Basic::Vint64);
    b.field("Vuint", &Basic::Vuint);
    b.field("Vbool", &Basic::Vbool);
    b.field("Vfloat", &Basic::Vfloat);
    b.field("Vextra", &Basic::Vextra);
    b.hidden("vsilent", &Basic::vsilent);
    b.field("Vdata", &Basic::Vdata);
    b.field("VjsonInt", &Basic::VjsonInt);
    b.field("VjsonUint", &Basic::VjsonUint);
    b.field("VjsonUint64", &Basic::VjsonUint64);
    b.field("VjsonFloat", &Basic::VjsonFloat);
}

struct BasicSquash {
    Basic Test;
};

inline void describe(StructBuilder<BasicSquash>& b) {
    b.field("Test", &BasicSquash::Test, ",squash");
}

struct Embedded {
    Basic basic;
    std::string Vunique;
};

inline void describe(StructBuilder<Embedded>& b) {
    b.embed("Basic", &Embedded::basic);
    b.field("Vunique", &Embedded::Vunique);
}

struct EmbeddedPointer {
    std::shared_ptr<Basic> basic;
    std::string Vunique;
};

inline void describe(StructBuilder<EmbeddedPointer>& b) {
    b.embed("Basic", &EmbeddedPointer::basic);
    b.field("Vunique", &EmbeddedPointer::Vunique);
}

struct EmbeddedSquash {
    Basic basic;
    std::string Vunique;
};

inline void describe(StructBuilder<EmbeddedSquash>& b) {
    b.embed("Basic", &EmbeddedSquash::basic, ",squash");
    b.field("Vunique", &EmbeddedSquash::Vunique);
}

struct EmbeddedPointerSquash {
    std::unique_ptr<Basic> basic;
    std::string Vunique;
};

inline void describe(StructBuilder<EmbeddedPointerSquash>& b) {
    b.embed("Basic", &EmbeddedPointerSquash::basic, ",squash");
    b.field("Vunique", &EmbeddedPointerSquash::Vunique);
}

struct TaggedUnique {
    std::string Vunique;
    std::optional<std::string> Vtime;
};

inline void describe(StructBuilder<TaggedUnique>& b) {
    b.field("Vunique", &TaggedUnique::Vunique, "vunique");
    b.field("Vtime", &TaggedUnique::Vtime, "time");
}

struct NestedPointerWithTags {
    std::shared_ptr<TaggedUnique> Vbar;
};

inline void describe(StructBuilder<NestedPointerWithTags>& b) {
    b.field("Vbar", &NestedPointerWithTags::Vbar, "vbar");
}

struct EmbeddedPointerSquashWithNestedTags {
    std::shared_ptr<NestedPointerWithTags> nested;
    std::string Vunique;
};

inline void describe(StructBuilder<EmbeddedPointerSquashWithNestedTags>& b) {
    b.embed("NestedPointerWithTags", &EmbeddedPointerSquashWithNestedTags::nested, ",squash");
    b.field("Vunique", &EmbeddedPointerSquashWithNestedTags::Vunique);
}

struct EmbeddedAndNamed {
    Basic basic;
    Basic Named;
    std::string Vunique;
};

inline void describe(StructBuilder<EmbeddedAndNamed>& b) {
    b.embed("Basic", &EmbeddedAndNamed::basic);
    b.field("Named", &EmbeddedAndNamed::Named);
    b.field("Vunique", &EmbeddedAndNamed::Vunique);
}

struct SquashOnNonStructType {
    int InvalidSquashType = 0;
};

inline void describe(StructBuilder<SquashOnNonStructType>& b) {
    b.field("InvalidSquashType", &SquashOnNonStructType::InvalidSquashType, ",squash");
}

struct Map {
    std::string Vfoo;
    std::map<std::string, std::string> Vother;
};

inline void describe(StructBuilder<Map>& b) {
    b.field("Vfoo", &Map::Vfoo);
    b.field("Vother", &Map::Vother);
}

struct Nested {
    std::string Vfoo;
    Basic Vbar;
};

inline void describe(StructBuilder<Nested>& b) {
    b.field("Vfoo", &Nested::Vfoo);
    b.field("Vbar", &Nested::Vbar);
}

struct NestedPointer {
    std::string Vfoo;
    std::unique_ptr<Basic> Vbar;
};

inline void describe(StructBuilder<NestedPointer>& b) {
    b.field("Vfoo", &NestedPointer::Vfoo);
    b.field("Vbar", &NestedPointer::Vbar);
}

struct NilPointer {
    std::shared_ptr<std::string> Value;
};

inline void describe(StructBuilder<NilPointer>& b) {
    b.field("Value", &NilPointer::Value);
}

struct Slice {
    std::string Vfoo;
    std::vector<std::string> Vbar;
};

inline void describe(StructBuilder<Slice>& b) {
    b.field("Vfoo", &Slice::Vfoo);
    b.field("Vbar", &Slice::Vbar);
}

struct SliceOfByte {
    std::string Vfoo;
    std::vector<std::uint8_t> Vbar;
};

inline void describe(StructBuilder<SliceOfByte>& b) {
    b.field("Vfoo", &SliceOfByte::Vfoo);
    b.field("Vbar", &SliceOfByte::Vbar);
}

struct SliceOfStruct {
    std::vector<Basic> Value;
};

inline void describe(StructBuilder<SliceOfStruct>& b) {
    b.field("Value", &SliceOfStruct::Value);
}

struct Array {
    std::string Vfoo;
    std::array<std::string, 2> Vbar;
};

inline void describe(StructBuilder<Array>& b) {
    b.field("Vfoo", &Array::Vfoo);
    b.field("Vbar", &Array::Vbar);
}

struct ArrayOfStruct {
    std::array<Basic, 2> Value;
};

inline void describe(StructBuilder<ArrayOfStruct>& b) {
    b.field("Value", &ArrayOfStruct::Value);
}

struct Tagged {
    std::string Extra;
    std::string Value;
};

inline void describe(StructBuilder<Tagged>& b) {
    b.field("Extra", &Tagged::Extra, "bar,what,what");
    b.field("Value", &Tagged::Value, "foo");
}

struct Remainder {
    std::string A;
    std::map<std::string, Value> Extra;
};

inline void describe(StructBuilder<Remainder>& b) {
    b.field("A", &Remainder::A);
    b.field("Extra", &Remainder::Extra, ",remain");
}

struct StructWithOmitEmpty {
    std::string VisibleStringField;
    std::string OmitStringField;
    int VisibleIntField = 0;
    int OmitIntField = 0;
    double VisibleFloatField = 0.0;
    double OmitFloatField = 0.0;
    std::vector<Value> VisibleSliceField;
    std::vector<Value> OmitSliceField;
    std::map<std::string, Value> VisibleMapField;
    std::map<std::string, Value> OmitMapField;
    std::shared_ptr<Nested> NestedField;
    std::shared_ptr<Nested> OmitNestedField;
};

inline void describe(StructBuilder<StructWithOmitEmpty>& b) {
    b.field("VisibleStringField", &StructWithOmitEmpty::VisibleStringField, "visible-string");
    b.field("OmitStringField", &StructWithOmitEmpty::OmitStringField, "omittable-string,omitempty");
    b.field("VisibleIntField", &StructWithOmitEmpty::VisibleIntField, "visible-int");
    b.field("OmitIntField", &StructWithOmitEmpty::OmitIntField, "omittable-int,omitempty");
    b.field("VisibleFloatField", &StructWithOmitEmpty::VisibleFloatField, "visible-float");
    b.field("OmitFloatField", &StructWithOmitEmpty::OmitFloatField, "omittable-float,omitempty");
    b.field("VisibleSliceField", &StructWithOmitEmpty::VisibleSliceField, "visible-slice");
    b.field("OmitSliceField", &StructWithOmitEmpty::OmitSliceField, "omittable-slice,omitempty");
    b.field("VisibleMapField", &StructWithOmitEmpty::VisibleMapField, "visible-map");
    b.field("OmitMapField", &StructWithOmitEmpty::OmitMapField, "omittable-map,omitempty");
    b.field("NestedField", &StructWithOmitEmpty::NestedField, "visible-nested");
    b.field("OmitNestedField", &StructWithOmitEmpty::OmitNestedField, "omittable-nested,omitempty");
}

struct TypeConversionResult {
    float IntToFloat = 0;
    unsigned IntToUint = 0;
    bool IntToBool = false;
    std::string IntToString;
    int UintToInt = 0;
    float UintToFloat = 0;
    bool UintToBool = false;
    std::string UintToString;
    int BoolToInt = 0;
    unsigned BoolToUint = 0;
    float BoolToFloat = 0;
    std::string BoolToString;
    int FloatToInt = 0;
    unsigned FloatToUint = 0;
    bool FloatToBool = false;
    std::string FloatToString;
    std::string SliceUint8ToString;
    std::vector<std::uint8_t> StringToSliceUint8;
    int StringToInt = 0;
    unsigned StringToUint = 0;
    bool StringToBool = false;
    float StringToFloat = 0;
    std::vector<std::string> StringToStrSlice;
    std::vector<int> StringToIntSlice;
    std::array<std::string, 1> StringToStrArray;
    std::array<int, 1> StringToIntArray{};
    std::map<std::string, Value> SliceToMap;
    std::vector<Value> MapToSlice;
    std::map<std::string, Value> ArrayToMap;
    std::array<Value, 1> MapToArray;
};

inline void describe(StructBuilder<TypeConversionResult>& b) {
    b.field("IntToFloat", &TypeConversionResult::IntToFloat);
    b.field("IntToUint", &TypeConversionResult::IntToUint);
    b.field("IntToBool", &TypeConversionResult::IntToBool);
    b.field("IntToString", &TypeConversionResult::IntToString);
    b.field("UintToInt", &TypeConversionResult::UintToInt);
    b.field("UintToFloat", &TypeConversionResult::UintToFloat);
    b.field("UintToBool", &TypeConversionResult::UintToBool);
    b.field("UintToString", &TypeConversionResult::UintToString);
    b.field("BoolToInt", &TypeConversionResult::BoolToInt);
    b.field("BoolToUint", &TypeConversionResult::BoolToUint);
    b.field("BoolToFloat", &TypeConversionResult::BoolToFloat);
    b.field("BoolToString", &TypeConversionResult::BoolToString);
    b.field("FloatToInt", &TypeConversionResult::FloatToInt);
    b.field("FloatToUint", &TypeConversionResult::FloatToUint);
    b.field("FloatToBool", &TypeConversionResult::FloatToBool);
    b.field("FloatToString", &TypeConversionResult::FloatToString);
    b.field("SliceUint8ToString", &TypeConversionResult::SliceUint8ToString);
    b.field("StringToSliceUint8", &TypeConversionResult::StringToSliceUint8);
    b.field("StringToInt", &TypeConversionResult::StringToInt);
    b.field("StringToUint", &TypeConversionResult::StringToUint);
    b.field("StringToBool", &TypeConversionResult::StringToBool);
    b.field("StringToFloat", &TypeConversionResult::StringToFloat);
    b.field("StringToStrSlice", &TypeConversionResult::StringToStrSlice);
    b.field("StringToIntSlice", &TypeConversionResult::StringToIntSlice);
    b.field("StringToStrArray", &TypeConversionResult::StringToStrArray);
    b.field("StringToIntArray", &TypeConversionResult::StringToIntArray);
    b.field("SliceToMap", &TypeConversionResult::SliceToMap);
    b.field("MapToSlice", &TypeConversionResult::MapToSlice);
    b.field("ArrayToMap", &TypeConversionResult::ArrayToMap);
    b.field("MapToArray", &TypeConversionResult::MapToArray);
}

} // namespace fixtures

#endif // MORPH_TESTS_FIXTURES_HPP
