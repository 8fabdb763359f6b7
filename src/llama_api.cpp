// llamaload - llama.cpp Function Table and Wrappers Implementation
//
// 结构体按值传递的签名（逐个列出）：
//   llama_model_default_params          返回 llama_model_params
//   llama_context_default_params        返回 llama_context_params
//   llama_sampler_chain_default_params  返回 llama_sampler_chain_params
//   llama_model_load_from_file          参数 llama_model_params
//   llama_init_from_model               参数 llama_context_params
//   llama_batch_init / llama_batch_get_one  返回 llama_batch
//   llama_batch_free / llama_decode / llama_encode  参数 llama_batch
//   llama_sampler_chain_init            参数 llama_sampler_chain_params
// Darwin 上以 DarwinOnly 条目直接绑定类型化指针；其他平台解析地址后
// 通过共享的 CallPlanCache 构造 TypedCall。其余签名在所有平台上直接绑定。

#include "llama_api.hpp"
#include "log.hpp"
#include <limits>

namespace llamaload {

namespace {

LoaderOptions optionsFrom(const Config& config) {
    LoaderOptions options;
    if (config.preload_siblings) {
        options.preload_siblings = *config.preload_siblings;
    }
    return options;
}

Status unavailable(const char* name) {
    return Status(ErrorCode::FunctionUnavailable,
                  std::string(name) + " is not available in this build");
}

} // namespace

LlamaApi& LlamaApi::instance() {
    static const Config config = Config::fromEnvironment();
    static LlamaApi api(std::make_unique<ConfigPathResolver>(config), optionsFrom(config));
    return api;
}

LlamaApi::LlamaApi(std::unique_ptr<PathResolver> resolver, LoaderOptions options)
    : resolver_(std::move(resolver)),
      loader_(*resolver_, *this, std::move(options)) {
    specs_ = {
        bindSpec(backend_init_, "llama_backend_init"),
        bindSpec(backend_free_, "llama_backend_free"),
        bindSpec(model_free_, "llama_model_free"),
        bindSpec(free_, "llama_free"),
        bindSpec(n_ctx_, "llama_n_ctx"),

        bindSpec(model_get_vocab_, "llama_model_get_vocab"),
        bindSpec(vocab_n_tokens_, "llama_vocab_n_tokens"),
        bindSpec(vocab_bos_, "llama_vocab_bos"),
        bindSpec(vocab_eos_, "llama_vocab_eos"),
        bindSpec(tokenize_, "llama_tokenize"),
        bindSpec(token_to_piece_, "llama_token_to_piece"),

        bindSpec(get_logits_, "llama_get_logits"),
        bindSpec(get_logits_ith_, "llama_get_logits_ith"),

        bindSpec(sampler_chain_add_, "llama_sampler_chain_add"),
        bindSpec(sampler_init_greedy_, "llama_sampler_init_greedy"),
        bindSpec(sampler_sample_, "llama_sampler_sample"),
        bindSpec(sampler_free_, "llama_sampler_free"),

        bindSpec(supports_mmap_, "llama_supports_mmap"),
        bindSpec(supports_mlock_, "llama_supports_mlock"),
        bindSpec(supports_gpu_offload_, "llama_supports_gpu_offload"),
        bindSpec(supports_rpc_, "llama_supports_rpc", Requirement::Optional),
        bindSpec(max_devices_, "llama_max_devices"),
        bindSpec(print_system_info_, "llama_print_system_info"),

        // ggml 符号可能位于兄弟模块，也可能整个缺失
        bindSpec(ggml_type_size_, "ggml_type_size", Requirement::Optional),
        bindSpec(ggml_type_name_, "ggml_type_name", Requirement::Optional),
        bindSpec(ggml_backend_dev_count_, "ggml_backend_dev_count", Requirement::Optional),
        bindSpec(ggml_backend_cpu_buffer_type_, "ggml_backend_cpu_buffer_type", Requirement::Optional),
        bindSpec(ggml_backend_load_all_, "ggml_backend_load_all", Requirement::Optional),
        bindSpec(ggml_backend_cuda_init_, "ggml_backend_cuda_init", Requirement::Optional),
        bindSpec(ggml_backend_metal_init_, "ggml_backend_metal_init", Requirement::Optional),
        bindSpec(ggml_backend_vk_init_, "ggml_backend_vk_init", Requirement::Optional),
    };

    addStructFunction(model_default_params_, "llama_model_default_params");
    addStructFunction(context_default_params_, "llama_context_default_params");
    addStructFunction(sampler_chain_default_params_, "llama_sampler_chain_default_params");
    addStructFunction(model_load_from_file_, "llama_model_load_from_file");
    addStructFunction(init_from_model_, "llama_init_from_model");
    addStructFunction(batch_init_, "llama_batch_init");
    addStructFunction(batch_get_one_, "llama_batch_get_one");
    addStructFunction(batch_free_, "llama_batch_free");
    addStructFunction(decode_, "llama_decode");
    addStructFunction(encode_, "llama_encode");
    addStructFunction(sampler_chain_init_, "llama_sampler_chain_init");
}

LlamaApi::~LlamaApi() {
    // 函数槽在 loader_ 之前声明，必须在这里先卸载
    Status status = loader_.unload();
    if (!status.ok()) {
        LOGW("Unload during destruction: %s", status.toString().c_str());
    }
}

template <typename Sig>
void LlamaApi::addStructFunction(DualPathCall<Sig>& slot, const char* name) {
    specs_.push_back(bindSpec(slot.direct, name, Requirement::Required, PlatformScope::DarwinOnly));

    PlannedSpec planned;
    planned.name = name;
    planned.prepare = [this, &slot](void* address) {
        return TypedCall<Sig>::create(call_plans_, address, slot.planned);
    };
    planned.reset = [&slot]() { slot.planned.reset(); };
    planned_.push_back(std::move(planned));
}

Status LlamaApi::bind(const SymbolRegistry& registry, NativeHandle primary) {
    Status status = bindSet(registry, primary, specs_);

    if (!kDirectStructBinding) {
        Status planned = prepareStructCalls(registry, primary);
        if (status.ok()) {
            status = planned;
        } else if (!planned.ok()) {
            LOGE("Struct-valued bindings also failed: %s", planned.toString().c_str());
        }
    }
    return status;
}

Status LlamaApi::prepareStructCalls(const SymbolRegistry& registry, NativeHandle primary) {
    std::string missing;
    size_t missing_count = 0;

    for (const auto& planned : planned_) {
        SymbolBinding binding = registry.resolve(planned.name, primary);
        if (!binding.valid()) {
            planned.reset();
            if (planned.requirement == Requirement::Required) {
                LOGE("Required symbol not found: %s", planned.name.c_str());
                if (!missing.empty()) missing += ", ";
                missing += planned.name;
                missing_count++;
            }
            continue;
        }

        Status status = planned.prepare(binding.address);
        if (!status.ok()) {
            return status.prepend(planned.name);
        }
    }

    if (missing_count) {
        return Status(ErrorCode::SymbolNotFound,
                      std::to_string(missing_count) + " required symbol(s) not found: " + missing);
    }

    LOGD("Prepared %zu struct-valued call(s), %zu distinct plan(s)",
         planned_.size(), call_plans_.size());
    return Status::OK();
}

void LlamaApi::reset() {
    resetSet(specs_);
    for (const auto& planned : planned_) {
        planned.reset();
    }
}

template <typename Fn>
Status LlamaApi::ready(Fn* const& slot, const char* name) {
    Status status = loader_.ensureLoaded();
    if (!status.ok()) {
        return status;
    }
    if (!slot) {
        return unavailable(name);
    }
    return Status::OK();
}

template <typename Sig>
Status LlamaApi::ready(const DualPathCall<Sig>& slot, const char* name) {
    Status status = loader_.ensureLoaded();
    if (!status.ok()) {
        return status;
    }
    if (!slot.available()) {
        return unavailable(name);
    }
    return Status::OK();
}

// ==================== Backend ====================

Status LlamaApi::backendInit() {
    Status status = ready(backend_init_, "llama_backend_init");
    if (!status.ok()) return status;
    backend_init_();
    return Status::OK();
}

Status LlamaApi::backendFree() {
    // 未加载时无事可做
    if (!loader_.isLoaded()) return Status::OK();
    Status status = ready(backend_free_, "llama_backend_free");
    if (!status.ok()) return status;
    backend_free_();
    return Status::OK();
}

// ==================== Default parameters ====================

Status LlamaApi::modelDefaultParams(llama_model_params& out) {
    Status status = ready(model_default_params_, "llama_model_default_params");
    if (!status.ok()) return status;
    out = model_default_params_();
    return Status::OK();
}

Status LlamaApi::contextDefaultParams(llama_context_params& out) {
    Status status = ready(context_default_params_, "llama_context_default_params");
    if (!status.ok()) return status;
    out = context_default_params_();
    return Status::OK();
}

Status LlamaApi::samplerChainDefaultParams(llama_sampler_chain_params& out) {
    Status status = ready(sampler_chain_default_params_, "llama_sampler_chain_default_params");
    if (!status.ok()) return status;
    out = sampler_chain_default_params_();
    return Status::OK();
}

// ==================== Model / context ====================

Status LlamaApi::modelLoadFromFile(const std::string& path, const llama_model_params& params,
                                   llama_model*& out) {
    out = nullptr;
    Status status = ready(model_load_from_file_, "llama_model_load_from_file");
    if (!status.ok()) return status;

    out = model_load_from_file_(path.c_str(), params);
    if (!out) {
        return Status(ErrorCode::InvalidArgument, "failed to load model from " + path);
    }
    return Status::OK();
}

Status LlamaApi::modelFree(llama_model* model) {
    if (!model) return Status::OK();
    Status status = ready(model_free_, "llama_model_free");
    if (!status.ok()) return status;
    model_free_(model);
    return Status::OK();
}

Status LlamaApi::initFromModel(llama_model* model, const llama_context_params& params,
                               llama_context*& out) {
    out = nullptr;
    if (!model) {
        return Status(ErrorCode::InvalidArgument, "model is null");
    }
    Status status = ready(init_from_model_, "llama_init_from_model");
    if (!status.ok()) return status;

    out = init_from_model_(model, params);
    if (!out) {
        return Status(ErrorCode::InvalidArgument, "failed to create context");
    }
    return Status::OK();
}

Status LlamaApi::contextFree(llama_context* ctx) {
    if (!ctx) return Status::OK();
    Status status = ready(free_, "llama_free");
    if (!status.ok()) return status;
    free_(ctx);
    return Status::OK();
}

Status LlamaApi::nCtx(const llama_context* ctx, uint32_t& out) {
    Status status = ready(n_ctx_, "llama_n_ctx");
    if (!status.ok()) return status;
    out = n_ctx_(ctx);
    return Status::OK();
}

// ==================== Vocabulary ====================

Status LlamaApi::modelGetVocab(const llama_model* model, const llama_vocab*& out) {
    out = nullptr;
    Status status = ready(model_get_vocab_, "llama_model_get_vocab");
    if (!status.ok()) return status;

    out = model_get_vocab_(model);
    if (!out) {
        return Status(ErrorCode::InvalidArgument, "model has no vocabulary");
    }
    return Status::OK();
}

Status LlamaApi::vocabNTokens(const llama_vocab* vocab, int32_t& out) {
    Status status = ready(vocab_n_tokens_, "llama_vocab_n_tokens");
    if (!status.ok()) return status;
    out = vocab_n_tokens_(vocab);
    return Status::OK();
}

Status LlamaApi::vocabBos(const llama_vocab* vocab, llama_token& out) {
    Status status = ready(vocab_bos_, "llama_vocab_bos");
    if (!status.ok()) return status;
    out = vocab_bos_(vocab);
    return Status::OK();
}

Status LlamaApi::vocabEos(const llama_vocab* vocab, llama_token& out) {
    Status status = ready(vocab_eos_, "llama_vocab_eos");
    if (!status.ok()) return status;
    out = vocab_eos_(vocab);
    return Status::OK();
}

Status LlamaApi::tokenize(const llama_vocab* vocab, const std::string& text, bool add_special,
                          bool parse_special, std::vector<llama_token>& out) {
    out.clear();
    Status status = ready(tokenize_, "llama_tokenize");
    if (!status.ok()) return status;

    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return Status(ErrorCode::InvalidArgument,
                      "text too long: " + std::to_string(text.size()) + " bytes");
    }
    const int32_t text_len = static_cast<int32_t>(text.size());

    // 缓冲区不足时返回所需数量的相反数
    int32_t n = tokenize_(vocab, text.c_str(), text_len, nullptr, 0, add_special, parse_special);
    if (n == 0) {
        return Status::OK();
    }
    // INT32_MIN 表示 token 数超出 int32
    if (n == std::numeric_limits<int32_t>::min()) {
        return Status(ErrorCode::InvalidArgument,
                      "token count overflows int32 for " + std::to_string(text.size()) +
                      " bytes of text");
    }
    const int32_t needed = n < 0 ? -n : n;

    out.resize(static_cast<size_t>(needed));
    n = tokenize_(vocab, text.c_str(), text_len, out.data(), needed, add_special, parse_special);
    if (n < 0) {
        out.clear();
        return Status(ErrorCode::InvalidArgument,
                      "tokenization failed with code " + std::to_string(n));
    }
    out.resize(static_cast<size_t>(n));
    return Status::OK();
}

Status LlamaApi::tokenToPiece(const llama_vocab* vocab, llama_token token, bool special,
                              std::string& out) {
    out.clear();
    Status status = ready(token_to_piece_, "llama_token_to_piece");
    if (!status.ok()) return status;

    std::string buf(16, '\0');
    int32_t n = token_to_piece_(vocab, token, &buf[0], static_cast<int32_t>(buf.size()), 0, special);
    if (n == std::numeric_limits<int32_t>::min()) {
        return Status(ErrorCode::InvalidArgument,
                      "token_to_piece failed for token " + std::to_string(token));
    }
    if (n < 0) {
        buf.resize(static_cast<size_t>(-n));
        n = token_to_piece_(vocab, token, &buf[0], static_cast<int32_t>(buf.size()), 0, special);
        if (n < 0) {
            return Status(ErrorCode::InvalidArgument,
                          "token_to_piece failed for token " + std::to_string(token));
        }
    }
    buf.resize(static_cast<size_t>(n));
    out = std::move(buf);
    return Status::OK();
}

// ==================== Batch / decode ====================

Status LlamaApi::batchInit(int32_t n_tokens, int32_t embd, int32_t n_seq_max, llama_batch& out) {
    out = llama_batch{};
    if (n_tokens <= 0 || n_seq_max <= 0) {
        return Status(ErrorCode::InvalidArgument, "batch size and sequence count must be positive");
    }
    Status status = ready(batch_init_, "llama_batch_init");
    if (!status.ok()) return status;
    out = batch_init_(n_tokens, embd, n_seq_max);
    return Status::OK();
}

Status LlamaApi::batchGetOne(llama_token* tokens, int32_t n_tokens, llama_batch& out) {
    out = llama_batch{};
    if (!tokens || n_tokens <= 0) {
        return Status(ErrorCode::InvalidArgument, "batch needs at least one token");
    }
    Status status = ready(batch_get_one_, "llama_batch_get_one");
    if (!status.ok()) return status;
    out = batch_get_one_(tokens, n_tokens);
    return Status::OK();
}

Status LlamaApi::batchFree(const llama_batch& batch) {
    Status status = ready(batch_free_, "llama_batch_free");
    if (!status.ok()) return status;
    batch_free_(batch);
    return Status::OK();
}

Status LlamaApi::decode(llama_context* ctx, const llama_batch& batch, int32_t& result) {
    Status status = ready(decode_, "llama_decode");
    if (!status.ok()) return status;
    result = decode_(ctx, batch);
    if (result != 0) {
        LOGW("llama_decode returned %d", result);
    }
    return Status::OK();
}

Status LlamaApi::encode(llama_context* ctx, const llama_batch& batch, int32_t& result) {
    Status status = ready(encode_, "llama_encode");
    if (!status.ok()) return status;
    result = encode_(ctx, batch);
    if (result != 0) {
        LOGW("llama_encode returned %d", result);
    }
    return Status::OK();
}

Status LlamaApi::getLogits(llama_context* ctx, float*& out) {
    Status status = ready(get_logits_, "llama_get_logits");
    if (!status.ok()) return status;
    out = get_logits_(ctx);
    return Status::OK();
}

Status LlamaApi::getLogitsIth(llama_context* ctx, int32_t i, float*& out) {
    Status status = ready(get_logits_ith_, "llama_get_logits_ith");
    if (!status.ok()) return status;
    out = get_logits_ith_(ctx, i);
    return Status::OK();
}

// ==================== Sampling ====================

Status LlamaApi::samplerChainInit(const llama_sampler_chain_params& params, llama_sampler*& out) {
    out = nullptr;
    Status status = ready(sampler_chain_init_, "llama_sampler_chain_init");
    if (!status.ok()) return status;
    out = sampler_chain_init_(params);
    return Status::OK();
}

Status LlamaApi::samplerChainAdd(llama_sampler* chain, llama_sampler* sampler) {
    if (!chain || !sampler) {
        return Status(ErrorCode::InvalidArgument, "sampler is null");
    }
    Status status = ready(sampler_chain_add_, "llama_sampler_chain_add");
    if (!status.ok()) return status;
    sampler_chain_add_(chain, sampler);
    return Status::OK();
}

Status LlamaApi::samplerInitGreedy(llama_sampler*& out) {
    out = nullptr;
    Status status = ready(sampler_init_greedy_, "llama_sampler_init_greedy");
    if (!status.ok()) return status;
    out = sampler_init_greedy_();
    return Status::OK();
}

Status LlamaApi::samplerSample(llama_sampler* sampler, llama_context* ctx, int32_t idx,
                               llama_token& out) {
    Status status = ready(sampler_sample_, "llama_sampler_sample");
    if (!status.ok()) return status;
    out = sampler_sample_(sampler, ctx, idx);
    return Status::OK();
}

Status LlamaApi::samplerFree(llama_sampler* sampler) {
    if (!sampler) return Status::OK();
    Status status = ready(sampler_free_, "llama_sampler_free");
    if (!status.ok()) return status;
    sampler_free_(sampler);
    return Status::OK();
}

// ==================== Capabilities ====================

Status LlamaApi::supportsMmap(bool& out) {
    Status status = ready(supports_mmap_, "llama_supports_mmap");
    if (!status.ok()) return status;
    out = supports_mmap_();
    return Status::OK();
}

Status LlamaApi::supportsMlock(bool& out) {
    Status status = ready(supports_mlock_, "llama_supports_mlock");
    if (!status.ok()) return status;
    out = supports_mlock_();
    return Status::OK();
}

Status LlamaApi::supportsGpuOffload(bool& out) {
    Status status = ready(supports_gpu_offload_, "llama_supports_gpu_offload");
    if (!status.ok()) return status;
    out = supports_gpu_offload_();
    return Status::OK();
}

Status LlamaApi::supportsRpc(bool& out) {
    Status status = ready(supports_rpc_, "llama_supports_rpc");
    if (!status.ok()) return status;
    out = supports_rpc_();
    return Status::OK();
}

Status LlamaApi::maxDevices(size_t& out) {
    Status status = ready(max_devices_, "llama_max_devices");
    if (!status.ok()) return status;
    out = max_devices_();
    return Status::OK();
}

Status LlamaApi::printSystemInfo(std::string& out) {
    Status status = ready(print_system_info_, "llama_print_system_info");
    if (!status.ok()) return status;
    const char* info = print_system_info_();
    out = info ? info : "";
    return Status::OK();
}

// ==================== ggml ====================

Status LlamaApi::ggmlTypeSize(int32_t type, size_t& out) {
    Status status = ready(ggml_type_size_, "ggml_type_size");
    if (!status.ok()) return status;
    out = ggml_type_size_(type);
    return Status::OK();
}

Status LlamaApi::ggmlTypeName(int32_t type, std::string& out) {
    Status status = ready(ggml_type_name_, "ggml_type_name");
    if (!status.ok()) return status;
    const char* name = ggml_type_name_(type);
    out = name ? name : "";
    return Status::OK();
}

Status LlamaApi::ggmlBackendDevCount(size_t& out) {
    Status status = ready(ggml_backend_dev_count_, "ggml_backend_dev_count");
    if (!status.ok()) return status;
    out = ggml_backend_dev_count_();
    return Status::OK();
}

Status LlamaApi::ggmlBackendCpuBufferType(ggml_backend_buffer_type_t& out) {
    Status status = ready(ggml_backend_cpu_buffer_type_, "ggml_backend_cpu_buffer_type");
    if (!status.ok()) return status;
    out = ggml_backend_cpu_buffer_type_();
    return Status::OK();
}

Status LlamaApi::ggmlBackendLoadAll() {
    Status status = ready(ggml_backend_load_all_, "ggml_backend_load_all");
    if (!status.ok()) return status;
    ggml_backend_load_all_();
    return Status::OK();
}

Status LlamaApi::backendCudaInit(int device, ggml_backend_t& out) {
    out = nullptr;
    Status status = ready(ggml_backend_cuda_init_, "ggml_backend_cuda_init");
    if (!status.ok()) return status;
    out = ggml_backend_cuda_init_(device);
    return Status::OK();
}

Status LlamaApi::backendMetalInit(ggml_backend_t& out) {
    out = nullptr;
    Status status = ready(ggml_backend_metal_init_, "ggml_backend_metal_init");
    if (!status.ok()) return status;
    out = ggml_backend_metal_init_();
    return Status::OK();
}

Status LlamaApi::backendVkInit(size_t device, ggml_backend_t& out) {
    out = nullptr;
    Status status = ready(ggml_backend_vk_init_, "ggml_backend_vk_init");
    if (!status.ok()) return status;
    out = ggml_backend_vk_init_(device);
    return Status::OK();
}

} // namespace llamaload
