// llamaload - Call Interface Tests

#include "call_interface.hpp"
#include "dynamic_loader.hpp"

#include <catch2/catch.hpp>

#include <cstddef>
#include <cstring>
#include <limits>

using namespace llamaload;

namespace {

struct Sample {
    int32_t id;
    float value;
    uint8_t flag;
};

struct Wide {
    int64_t a;
    double b;
    int8_t c;
    uint16_t d;
    void* p;
};

// 描述与 C++ 尺寸不一致
struct Mismatched {
    int32_t a;
    int32_t b;
    int32_t c;
    int32_t d;
};

bool sameBits(const Sample& x, const Sample& y) {
    return x.id == y.id &&
           std::memcmp(&x.value, &y.value, sizeof(float)) == 0 &&
           x.flag == y.flag;
}

} // namespace

namespace llamaload {

template <>
struct AbiType<Sample> {
    static ValueType get() {
        static const auto layout = StructLayout::describe(
            {FieldTag::Int32, FieldTag::Float, FieldTag::UInt8});
        return layout;
    }
};

template <>
struct AbiType<Wide> {
    static ValueType get() {
        static const auto layout = StructLayout::describe(
            {FieldTag::Int64, FieldTag::Double, FieldTag::Int8, FieldTag::UInt16, FieldTag::Pointer});
        return layout;
    }
};

template <>
struct AbiType<Mismatched> {
    static ValueType get() {
        static const auto layout = StructLayout::describe({FieldTag::Int32, FieldTag::Int32});
        return layout;
    }
};

} // namespace llamaload

TEST_CASE("struct layout description", "[ffi]")
{
    SECTION("matches the compiler layout")
    {
        auto layout = StructLayout::describe({FieldTag::Int32, FieldTag::Float, FieldTag::UInt8});
        REQUIRE(layout != nullptr);
        CHECK(layout->size() == sizeof(Sample));
        CHECK(layout->alignment() == alignof(Sample));
        REQUIRE(layout->offsets().size() == 3);
        CHECK(layout->offsets()[0] == offsetof(Sample, id));
        CHECK(layout->offsets()[1] == offsetof(Sample, value));
        CHECK(layout->offsets()[2] == offsetof(Sample, flag));
        CHECK(layout->signature() == "{i32,f32,u8}");
    }

    SECTION("mixed widths")
    {
        auto layout = AbiType<Wide>::get().layout();
        REQUIRE(layout != nullptr);
        CHECK(layout->size() == sizeof(Wide));
        CHECK(layout->offsets()[3] == offsetof(Wide, d));
        CHECK(layout->offsets()[4] == offsetof(Wide, p));
    }

    SECTION("invalid descriptions")
    {
        CHECK(StructLayout::describe({}) == nullptr);
        CHECK(StructLayout::describe({FieldTag::Int32, FieldTag::Void}) == nullptr);
    }
}

TEST_CASE("call plan preparation", "[ffi]")
{
    std::shared_ptr<const CallPlan> plan;

    SECTION("void argument is rejected")
    {
        Status status = CallPlan::prepare({FieldTag::Void}, FieldTag::Int32, plan);
        CHECK(status.code() == ErrorCode::UnsupportedSignature);
        CHECK(plan == nullptr);
    }

    SECTION("struct without layout is rejected")
    {
        ValueType empty(std::shared_ptr<const StructLayout>{});
        Status status = CallPlan::prepare({empty}, FieldTag::Void, plan);
        CHECK(status.code() == ErrorCode::UnsupportedSignature);
    }

    SECTION("signature text")
    {
        REQUIRE(CallPlan::prepare({AbiType<Sample>::get(), FieldTag::Float}, AbiType<Sample>::get(),
                                  plan).ok());
        CHECK(plan->signature() == "{i32,f32,u8}({i32,f32,u8},f32)");
    }
}

TEST_CASE("struct by value calls", "[ffi]")
{
    DynamicLoader loader;
    NativeHandle handle = kInvalidHandle;
    REQUIRE(loader.openModule(LLAMALOAD_STRUCT_ECHO, handle).ok());

    CallPlanCache cache;

    SECTION("round trip of {int32, float32, uint8}")
    {
        TypedCall<Sample(Sample)> echo;
        REQUIRE(TypedCall<Sample(Sample)>::create(cache, loader.resolve(handle, "echo_sample"), echo).ok());

        const Sample inputs[] = {
            {0, 0.0f, 0},
            {-7, -3.5f, 255},
            {std::numeric_limits<int32_t>::max(), 1.0e-3f, 1},
            {std::numeric_limits<int32_t>::min(), -0.0f, 128},
        };
        for (const Sample& in : inputs) {
            Sample out = echo(in);
            CHECK(sameBits(in, out));
        }
    }

    SECTION("struct with scalar arguments")
    {
        TypedCall<Sample(Sample, float, int32_t)> scale;
        REQUIRE(TypedCall<Sample(Sample, float, int32_t)>::create(
            cache, loader.resolve(handle, "scale_sample"), scale).ok());

        Sample out = scale(Sample{10, 1.5f, 7}, 2.0f, -20);
        CHECK(out.id == -10);
        CHECK(out.value == 3.0f);
        CHECK(out.flag == 7);
    }

    SECTION("large struct returned through memory")
    {
        TypedCall<Wide(Wide)> echo;
        REQUIRE(TypedCall<Wide(Wide)>::create(cache, loader.resolve(handle, "echo_wide"), echo).ok());

        int marker = 0;
        Wide in{-1234567890123LL, -2.25, -5, 65535, &marker};
        Wide out = echo(in);
        CHECK(out.a == in.a);
        CHECK(out.b == in.b);
        CHECK(out.c == in.c);
        CHECK(out.d == in.d);
        CHECK(out.p == &marker);
    }

    SECTION("small integer returns")
    {
        TypedCall<int32_t(Sample)> id;
        REQUIRE(TypedCall<int32_t(Sample)>::create(cache, loader.resolve(handle, "sample_id"), id).ok());
        CHECK(id(Sample{-42, 0.0f, 0}) == -42);

        TypedCall<int8_t(int8_t)> negate;
        REQUIRE(TypedCall<int8_t(int8_t)>::create(cache, loader.resolve(handle, "negate_i8"), negate).ok());
        CHECK(negate(5) == -5);
        CHECK(negate(-100) == 100);

        TypedCall<uint16_t(uint16_t, uint16_t)> add;
        REQUIRE(TypedCall<uint16_t(uint16_t, uint16_t)>::create(
            cache, loader.resolve(handle, "add_u16"), add).ok());
        CHECK(add(40000, 20000) == 60000);
    }

    SECTION("plans are cached by signature shape")
    {
        TypedCall<Sample(Sample)> first;
        TypedCall<Sample(Sample)> second;
        REQUIRE(TypedCall<Sample(Sample)>::create(cache, loader.resolve(handle, "echo_sample"), first).ok());
        const size_t plans = cache.size();
        REQUIRE(TypedCall<Sample(Sample)>::create(cache, loader.resolve(handle, "echo_sample"), second).ok());
        CHECK(cache.size() == plans);
        CHECK(first.plan() == second.plan());

        cache.clear();
        CHECK(cache.size() == 0);
        // 已持有的计划在清空缓存后仍然可用
        CHECK(sameBits(first(Sample{3, 3.0f, 3}), Sample{3, 3.0f, 3}));
    }

    SECTION("size mismatch is rejected")
    {
        TypedCall<int32_t(Mismatched)> call;
        Status status = TypedCall<int32_t(Mismatched)>::create(
            cache, loader.resolve(handle, "sample_id"), call);
        CHECK(status.code() == ErrorCode::UnsupportedSignature);
        CHECK_FALSE(call.valid());
    }

    SECTION("null address is rejected")
    {
        TypedCall<Sample(Sample)> call;
        CHECK(TypedCall<Sample(Sample)>::create(cache, nullptr, call).code() ==
              ErrorCode::InvalidArgument);
    }

    SECTION("direct and planned paths agree")
    {
        void* address = loader.resolve(handle, "scale_sample");
        REQUIRE(address != nullptr);

        DualPathCall<Sample(Sample, float, int32_t)> planned;
        REQUIRE(TypedCall<Sample(Sample, float, int32_t)>::create(cache, address, planned.planned).ok());

        DualPathCall<Sample(Sample, float, int32_t)> direct;
        direct.direct = reinterpret_cast<Sample (*)(Sample, float, int32_t)>(address);

        CHECK(planned.available());
        CHECK(direct.available());
        CHECK(sameBits(planned(Sample{1, 0.5f, 9}, 4.0f, 1), direct(Sample{1, 0.5f, 9}, 4.0f, 1)));

        planned.reset();
        CHECK_FALSE(planned.available());
    }

    CHECK(loader.close(handle).ok());
}
