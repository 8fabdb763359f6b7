// llamaload - Call-Interface Builder (struct-by-value calls via libffi)
#pragma once

#include "status.hpp"
#include <ffi.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace llamaload {

enum class FieldTag {
    Void,       // 仅用于返回值
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float,
    Double,
    Pointer,
};

const char* fieldTagName(FieldTag tag);
size_t fieldTagSize(FieldTag tag);

// 原生结构体的内存布局描述。字段必须按声明顺序、以精确的宽度列出；
// 构造后不可变，按形状复用
class StructLayout {
public:
    // 字段为空或含 Void 时返回 nullptr
    static std::shared_ptr<const StructLayout> describe(std::vector<FieldTag> fields);

    StructLayout(const StructLayout&) = delete;
    StructLayout& operator=(const StructLayout&) = delete;

    const std::vector<FieldTag>& fields() const { return fields_; }
    const std::vector<size_t>& offsets() const { return offsets_; }
    size_t size() const { return type_.size; }
    size_t alignment() const { return type_.alignment; }

    // "{i32,f32,u8}"
    std::string signature() const;

    ffi_type* ffiType() const { return &type_; }

private:
    explicit StructLayout(std::vector<FieldTag> fields);
    bool init();

    std::vector<FieldTag> fields_;
    std::vector<ffi_type*> elements_;
    std::vector<size_t> offsets_;
    mutable ffi_type type_{};
};

// 参数或返回值的类型：基本类型标签，或结构体布局
class ValueType {
public:
    ValueType(FieldTag tag) : tag_(tag) {}
    ValueType(std::shared_ptr<const StructLayout> layout)
        : tag_(FieldTag::Void), layout_(std::move(layout)), is_struct_(true) {}

    bool isStruct() const { return is_struct_; }
    bool isVoid() const { return !is_struct_ && tag_ == FieldTag::Void; }
    bool valid() const { return !is_struct_ || layout_ != nullptr; }
    FieldTag tag() const { return tag_; }
    const std::shared_ptr<const StructLayout>& layout() const { return layout_; }

    size_t size() const;
    std::string signature() const;
    ffi_type* ffiType() const;

private:
    FieldTag tag_;
    std::shared_ptr<const StructLayout> layout_;
    bool is_struct_ = false;
};

// 为某个签名准备好的调用约定，构造后不可变，可跨线程复用
class CallPlan {
public:
    static Status prepare(std::vector<ValueType> args, ValueType result,
                          std::shared_ptr<const CallPlan>& out);

    CallPlan(const CallPlan&) = delete;
    CallPlan& operator=(const CallPlan&) = delete;

    // args[i] 指向与第 i 个参数描述相符的内存；result 指向与返回值描述相符的缓冲区
    // （void 返回时可为 nullptr）。fn 的真实签名必须与本计划一致
    void invoke(void* fn, void* result, void** args) const;

    const std::vector<ValueType>& args() const { return args_; }
    const ValueType& result() const { return result_; }

    // "{i32,f32,u8}({i32,f32,u8})"
    std::string signature() const;

    static std::string signatureOf(const std::vector<ValueType>& args, const ValueType& result);

private:
    CallPlan(std::vector<ValueType> args, ValueType result)
        : args_(std::move(args)), result_(std::move(result)) {}

    std::vector<ValueType> args_;
    ValueType result_;
    std::vector<ffi_type*> arg_types_;
    mutable ffi_cif cif_{};
};

// 按签名形状缓存 CallPlan
class CallPlanCache {
public:
    Status get(const std::vector<ValueType>& args, const ValueType& result,
               std::shared_ptr<const CallPlan>& out);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const CallPlan>> plans_;
};

// C++ 类型到调用描述的映射。结构体类型需要显式特化并返回其 StructLayout
template <typename T, typename Enable = void>
struct AbiType;

template <>
struct AbiType<void> {
    static ValueType get() { return FieldTag::Void; }
};

template <>
struct AbiType<float> {
    static ValueType get() { return FieldTag::Float; }
};

template <>
struct AbiType<double> {
    static ValueType get() { return FieldTag::Double; }
};

template <typename T>
struct AbiType<T*> {
    static ValueType get() { return FieldTag::Pointer; }
};

template <typename T>
struct AbiType<T, typename std::enable_if<std::is_integral<T>::value>::type> {
    static ValueType get() {
        constexpr bool is_signed = std::is_signed<T>::value;
        switch (sizeof(T)) {
        case 1:  return is_signed ? FieldTag::Int8 : FieldTag::UInt8;
        case 2:  return is_signed ? FieldTag::Int16 : FieldTag::UInt16;
        case 4:  return is_signed ? FieldTag::Int32 : FieldTag::UInt32;
        default: return is_signed ? FieldTag::Int64 : FieldTag::UInt64;
        }
    }
};

// 把函数地址与 CallPlan 在构造时配对，调用点保持类型安全
template <typename Sig>
class TypedCall;

template <typename R, typename... Args>
class TypedCall<R(Args...)> {
public:
    TypedCall() = default;

    // C++ 类型尺寸与描述不一致时返回 UnsupportedSignature
    static Status create(CallPlanCache& cache, void* fn, TypedCall& out) {
        out.reset();
        if (!fn) {
            return Status(ErrorCode::InvalidArgument, "null function address");
        }

        std::vector<ValueType> args{AbiType<Args>::get()...};
        ValueType result = AbiType<R>::get();

        const size_t sizes[] = {sizeof(Args)..., 0};
        for (size_t i = 0; i < args.size(); i++) {
            if (!args[i].valid() || args[i].size() != sizes[i]) {
                return Status(ErrorCode::UnsupportedSignature,
                              "argument " + std::to_string(i) + " is " + std::to_string(sizes[i]) +
                              " bytes but descriptor " + args[i].signature() + " is " +
                              std::to_string(args[i].size()));
            }
        }

        if constexpr (!std::is_void<R>::value) {
            if (!result.valid() || result.size() != sizeof(R)) {
                return Status(ErrorCode::UnsupportedSignature,
                              "return type is " + std::to_string(sizeof(R)) +
                              " bytes but descriptor " + result.signature() + " is " +
                              std::to_string(result.size()));
            }
        }

        std::shared_ptr<const CallPlan> plan;
        Status status = cache.get(args, result, plan);
        if (!status.ok()) {
            return status;
        }

        out.plan_ = std::move(plan);
        out.fn_ = fn;
        return Status::OK();
    }

    bool valid() const { return plan_ != nullptr && fn_ != nullptr; }
    void reset() { plan_.reset(); fn_ = nullptr; }

    const CallPlan* plan() const { return plan_.get(); }
    void* address() const { return fn_; }

    R operator()(Args... args) const {
        void* values[sizeof...(Args) + 1] = {static_cast<void*>(&args)..., nullptr};
        if constexpr (std::is_void<R>::value) {
            plan_->invoke(fn_, nullptr, values);
        } else {
            R result{};
            plan_->invoke(fn_, &result, values);
            return result;
        }
    }

private:
    std::shared_ptr<const CallPlan> plan_;
    void* fn_ = nullptr;
};

// 结构体按值传递的函数槽：direct 为类型化函数指针，planned 走 CallPlan。
// 两者最多绑定其一，由调用方按平台策略决定
template <typename Sig>
class DualPathCall;

template <typename R, typename... Args>
class DualPathCall<R(Args...)> {
public:
    using Direct = R(Args...);

    Direct* direct = nullptr;
    TypedCall<R(Args...)> planned;

    bool available() const { return direct != nullptr || planned.valid(); }
    void reset() { direct = nullptr; planned.reset(); }

    R operator()(Args... args) const {
        if (direct) {
            return direct(args...);
        }
        return planned(args...);
    }
};

} // namespace llamaload
