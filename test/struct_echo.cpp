// llamaload - 测试用结构体按值传递函数
#include "fixture_export.hpp"
#include <cstdint>

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

FIXTURE_API Sample echo_sample(Sample in) {
    return in;
}

FIXTURE_API Sample scale_sample(Sample in, float factor, int32_t offset) {
    in.value *= factor;
    in.id += offset;
    return in;
}

FIXTURE_API Wide echo_wide(Wide in) {
    return in;
}

FIXTURE_API int32_t sample_id(Sample in) {
    return in.id;
}

FIXTURE_API int8_t negate_i8(int8_t v) {
    return static_cast<int8_t>(-v);
}

FIXTURE_API uint16_t add_u16(uint16_t a, uint16_t b) {
    return static_cast<uint16_t>(a + b);
}
