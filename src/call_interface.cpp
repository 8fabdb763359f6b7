// llamaload - Call-Interface Builder Implementation

#include "call_interface.hpp"
#include "log.hpp"
#include <cstring>

namespace llamaload {

namespace {

ffi_type* ffiTypeFor(FieldTag tag) {
    switch (tag) {
    case FieldTag::Void:    return &ffi_type_void;
    case FieldTag::Int8:    return &ffi_type_sint8;
    case FieldTag::UInt8:   return &ffi_type_uint8;
    case FieldTag::Int16:   return &ffi_type_sint16;
    case FieldTag::UInt16:  return &ffi_type_uint16;
    case FieldTag::Int32:   return &ffi_type_sint32;
    case FieldTag::UInt32:  return &ffi_type_uint32;
    case FieldTag::Int64:   return &ffi_type_sint64;
    case FieldTag::UInt64:  return &ffi_type_uint64;
    case FieldTag::Float:   return &ffi_type_float;
    case FieldTag::Double:  return &ffi_type_double;
    case FieldTag::Pointer: return &ffi_type_pointer;
    }
    return nullptr;
}

bool isSmallInteger(FieldTag tag) {
    switch (tag) {
    case FieldTag::Int8:
    case FieldTag::UInt8:
    case FieldTag::Int16:
    case FieldTag::UInt16:
    case FieldTag::Int32:
    case FieldTag::UInt32:
        return fieldTagSize(tag) < sizeof(ffi_arg);
    default:
        return false;
    }
}

// 小整数返回值由 libffi 按 ffi_arg 宽度写回，这里截断到真实宽度
void narrowResult(FieldTag tag, ffi_arg wide, void* result) {
    switch (tag) {
    case FieldTag::Int8: {
        int8_t v = static_cast<int8_t>(static_cast<ffi_sarg>(wide));
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    case FieldTag::UInt8: {
        uint8_t v = static_cast<uint8_t>(wide);
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    case FieldTag::Int16: {
        int16_t v = static_cast<int16_t>(static_cast<ffi_sarg>(wide));
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    case FieldTag::UInt16: {
        uint16_t v = static_cast<uint16_t>(wide);
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    case FieldTag::Int32: {
        int32_t v = static_cast<int32_t>(static_cast<ffi_sarg>(wide));
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    case FieldTag::UInt32: {
        uint32_t v = static_cast<uint32_t>(wide);
        std::memcpy(result, &v, sizeof(v));
        break;
    }
    default:
        break;
    }
}

const char* ffiStatusName(ffi_status status) {
    switch (status) {
    case FFI_OK:          return "FFI_OK";
    case FFI_BAD_TYPEDEF: return "FFI_BAD_TYPEDEF";
    case FFI_BAD_ABI:     return "FFI_BAD_ABI";
    default:              return "ffi_status";
    }
}

} // namespace

const char* fieldTagName(FieldTag tag) {
    switch (tag) {
    case FieldTag::Void:    return "void";
    case FieldTag::Int8:    return "i8";
    case FieldTag::UInt8:   return "u8";
    case FieldTag::Int16:   return "i16";
    case FieldTag::UInt16:  return "u16";
    case FieldTag::Int32:   return "i32";
    case FieldTag::UInt32:  return "u32";
    case FieldTag::Int64:   return "i64";
    case FieldTag::UInt64:  return "u64";
    case FieldTag::Float:   return "f32";
    case FieldTag::Double:  return "f64";
    case FieldTag::Pointer: return "ptr";
    }
    return "?";
}

size_t fieldTagSize(FieldTag tag) {
    switch (tag) {
    case FieldTag::Void:    return 0;
    case FieldTag::Int8:
    case FieldTag::UInt8:   return 1;
    case FieldTag::Int16:
    case FieldTag::UInt16:  return 2;
    case FieldTag::Int32:
    case FieldTag::UInt32:
    case FieldTag::Float:   return 4;
    case FieldTag::Int64:
    case FieldTag::UInt64:
    case FieldTag::Double:  return 8;
    case FieldTag::Pointer: return sizeof(void*);
    }
    return 0;
}

// ==================== StructLayout ====================

StructLayout::StructLayout(std::vector<FieldTag> fields) : fields_(std::move(fields)) {}

std::shared_ptr<const StructLayout> StructLayout::describe(std::vector<FieldTag> fields) {
    if (fields.empty()) {
        LOGE("Struct layout needs at least one field");
        return nullptr;
    }
    for (FieldTag tag : fields) {
        if (tag == FieldTag::Void) {
            LOGE("Struct layout cannot contain a void field");
            return nullptr;
        }
    }

    std::shared_ptr<StructLayout> layout(new StructLayout(std::move(fields)));
    if (!layout->init()) {
        return nullptr;
    }
    return layout;
}

bool StructLayout::init() {
    elements_.reserve(fields_.size() + 1);
    for (FieldTag tag : fields_) {
        elements_.push_back(ffiTypeFor(tag));
    }
    elements_.push_back(nullptr);

    type_.size = 0;
    type_.alignment = 0;
    type_.type = FFI_TYPE_STRUCT;
    type_.elements = elements_.data();

    // 同时填充 type_ 的 size 与 alignment
    offsets_.resize(fields_.size());
    ffi_status status = ffi_get_struct_offsets(FFI_DEFAULT_ABI, &type_, offsets_.data());
    if (status != FFI_OK) {
        LOGE("ffi_get_struct_offsets failed for %s: %s",
             signature().c_str(), ffiStatusName(status));
        return false;
    }

    LOGD("Struct layout %s: size=%zu align=%u",
         signature().c_str(), static_cast<size_t>(type_.size),
         static_cast<unsigned>(type_.alignment));
    return true;
}

std::string StructLayout::signature() const {
    std::string sig = "{";
    for (size_t i = 0; i < fields_.size(); i++) {
        if (i) sig += ",";
        sig += fieldTagName(fields_[i]);
    }
    sig += "}";
    return sig;
}

// ==================== ValueType ====================

size_t ValueType::size() const {
    if (is_struct_) {
        return layout_ ? layout_->size() : 0;
    }
    return fieldTagSize(tag_);
}

std::string ValueType::signature() const {
    if (is_struct_) {
        return layout_ ? layout_->signature() : "{?}";
    }
    return fieldTagName(tag_);
}

ffi_type* ValueType::ffiType() const {
    if (is_struct_) {
        return layout_ ? layout_->ffiType() : nullptr;
    }
    return ffiTypeFor(tag_);
}

// ==================== CallPlan ====================

std::string CallPlan::signatureOf(const std::vector<ValueType>& args, const ValueType& result) {
    std::string sig = result.signature() + "(";
    for (size_t i = 0; i < args.size(); i++) {
        if (i) sig += ",";
        sig += args[i].signature();
    }
    sig += ")";
    return sig;
}

std::string CallPlan::signature() const {
    return signatureOf(args_, result_);
}

Status CallPlan::prepare(std::vector<ValueType> args, ValueType result,
                         std::shared_ptr<const CallPlan>& out) {
    out.reset();

    if (!result.valid()) {
        return Status(ErrorCode::UnsupportedSignature, "return type has no layout");
    }
    for (size_t i = 0; i < args.size(); i++) {
        if (!args[i].valid()) {
            return Status(ErrorCode::UnsupportedSignature,
                          "argument " + std::to_string(i) + " has no layout");
        }
        if (args[i].isVoid()) {
            return Status(ErrorCode::UnsupportedSignature,
                          "argument " + std::to_string(i) + " cannot be void");
        }
    }

    std::shared_ptr<CallPlan> plan(new CallPlan(std::move(args), std::move(result)));
    plan->arg_types_.reserve(plan->args_.size());
    for (const auto& arg : plan->args_) {
        plan->arg_types_.push_back(arg.ffiType());
    }

    ffi_status status = ffi_prep_cif(&plan->cif_, FFI_DEFAULT_ABI,
                                     static_cast<unsigned>(plan->arg_types_.size()),
                                     plan->result_.ffiType(),
                                     plan->arg_types_.empty() ? nullptr : plan->arg_types_.data());
    if (status != FFI_OK) {
        LOGE("ffi_prep_cif failed for %s: %s", plan->signature().c_str(), ffiStatusName(status));
        return Status(ErrorCode::UnsupportedSignature,
                      "cannot prepare call " + plan->signature() + ": " + ffiStatusName(status),
                      LoadFailure::None, static_cast<long>(status));
    }

    LOGD("Prepared call plan %s", plan->signature().c_str());
    out = std::move(plan);
    return Status::OK();
}

void CallPlan::invoke(void* fn, void* result, void** args) const {
    if (result_.isVoid()) {
        ffi_call(&cif_, FFI_FN(fn), nullptr, args);
        return;
    }

    if (!result_.isStruct() && isSmallInteger(result_.tag())) {
        ffi_arg wide = 0;
        ffi_call(&cif_, FFI_FN(fn), &wide, args);
        narrowResult(result_.tag(), wide, result);
        return;
    }

    // 寄存器返回的小结构体可能按寄存器宽度写回，先落到足够大的缓冲区
    const size_t size = result_.size();
    if (result_.isStruct() && size < 2 * sizeof(ffi_arg)) {
        alignas(16) unsigned char scratch[4 * sizeof(ffi_arg)] = {};
        ffi_call(&cif_, FFI_FN(fn), scratch, args);
        std::memcpy(result, scratch, size);
        return;
    }

    ffi_call(&cif_, FFI_FN(fn), result, args);
}

// ==================== CallPlanCache ====================

Status CallPlanCache::get(const std::vector<ValueType>& args, const ValueType& result,
                          std::shared_ptr<const CallPlan>& out) {
    const std::string key = CallPlan::signatureOf(args, result);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = plans_.find(key);
    if (it != plans_.end()) {
        out = it->second;
        return Status::OK();
    }

    std::shared_ptr<const CallPlan> plan;
    Status status = CallPlan::prepare(args, result, plan);
    if (!status.ok()) {
        out.reset();
        return status;
    }

    plans_.emplace(key, plan);
    out = std::move(plan);
    return Status::OK();
}

size_t CallPlanCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plans_.size();
}

void CallPlanCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    plans_.clear();
}

} // namespace llamaload
