// llamaload - llama.cpp Function Table and Wrappers
#pragma once

#include "call_interface.hpp"
#include "function_binding.hpp"
#include "library_loader.hpp"
#include "llama_types.hpp"
#include "path_resolver.hpp"
#include "status.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace llamaload {

// 结构体按值传递的签名：Darwin 上直接绑定类型化指针，其余平台走 CallPlan
constexpr bool kDirectStructBinding = kIsDarwin;

class LlamaApi : public SymbolBinder {
public:
    // 进程级实例，按环境变量配置定位库文件
    static LlamaApi& instance();

    explicit LlamaApi(std::unique_ptr<PathResolver> resolver,
                      LoaderOptions options = LoaderOptions());
    ~LlamaApi() override;

    LlamaApi(const LlamaApi&) = delete;
    LlamaApi& operator=(const LlamaApi&) = delete;

    Status load() { return loader_.load(); }
    Status unload() { return loader_.unload(); }
    Status ensureLoaded() { return loader_.ensureLoaded(); }
    bool isLoaded() const { return loader_.isLoaded(); }
    NativeHandle handle() const { return loader_.handle(); }
    LibraryLoader& loader() { return loader_; }
    const CallPlanCache& callPlans() const { return call_plans_; }

    // SymbolBinder
    Status bind(const SymbolRegistry& registry, NativeHandle primary) override;
    void reset() override;

    // ==================== Backend ====================
    Status backendInit();
    Status backendFree();

    // ==================== Default parameters ====================
    Status modelDefaultParams(llama_model_params& out);
    Status contextDefaultParams(llama_context_params& out);
    Status samplerChainDefaultParams(llama_sampler_chain_params& out);

    // ==================== Model / context ====================
    Status modelLoadFromFile(const std::string& path, const llama_model_params& params,
                             llama_model*& out);
    Status modelFree(llama_model* model);
    Status initFromModel(llama_model* model, const llama_context_params& params,
                         llama_context*& out);
    Status contextFree(llama_context* ctx);
    Status nCtx(const llama_context* ctx, uint32_t& out);

    // ==================== Vocabulary ====================
    Status modelGetVocab(const llama_model* model, const llama_vocab*& out);
    Status vocabNTokens(const llama_vocab* vocab, int32_t& out);
    Status vocabBos(const llama_vocab* vocab, llama_token& out);
    Status vocabEos(const llama_vocab* vocab, llama_token& out);

    // 先探测所需长度再填充
    Status tokenize(const llama_vocab* vocab, const std::string& text, bool add_special,
                    bool parse_special, std::vector<llama_token>& out);
    Status tokenToPiece(const llama_vocab* vocab, llama_token token, bool special,
                        std::string& out);

    // ==================== Batch / decode ====================
    Status batchInit(int32_t n_tokens, int32_t embd, int32_t n_seq_max, llama_batch& out);
    Status batchGetOne(llama_token* tokens, int32_t n_tokens, llama_batch& out);
    Status batchFree(const llama_batch& batch);

    // result 为原生返回码，0 表示成功
    Status decode(llama_context* ctx, const llama_batch& batch, int32_t& result);
    Status encode(llama_context* ctx, const llama_batch& batch, int32_t& result);

    Status getLogits(llama_context* ctx, float*& out);
    Status getLogitsIth(llama_context* ctx, int32_t i, float*& out);

    // ==================== Sampling ====================
    Status samplerChainInit(const llama_sampler_chain_params& params, llama_sampler*& out);
    Status samplerChainAdd(llama_sampler* chain, llama_sampler* sampler);
    Status samplerInitGreedy(llama_sampler*& out);
    Status samplerSample(llama_sampler* sampler, llama_context* ctx, int32_t idx,
                         llama_token& out);
    Status samplerFree(llama_sampler* sampler);

    // ==================== Capabilities ====================
    Status supportsMmap(bool& out);
    Status supportsMlock(bool& out);
    Status supportsGpuOffload(bool& out);
    Status supportsRpc(bool& out);
    Status maxDevices(size_t& out);
    Status printSystemInfo(std::string& out);

    // ==================== ggml (optional) ====================
    Status ggmlTypeSize(int32_t type, size_t& out);
    Status ggmlTypeName(int32_t type, std::string& out);
    Status ggmlBackendDevCount(size_t& out);
    Status ggmlBackendCpuBufferType(ggml_backend_buffer_type_t& out);
    Status ggmlBackendLoadAll();

    // GPU 后端只存在于对应的构建中
    Status backendCudaInit(int device, ggml_backend_t& out);
    Status backendMetalInit(ggml_backend_t& out);
    Status backendVkInit(size_t device, ggml_backend_t& out);

private:
    struct PlannedSpec {
        std::string name;
        Requirement requirement = Requirement::Required;
        std::function<Status(void*)> prepare;
        std::function<void()> reset;
    };

    template <typename Sig>
    void addStructFunction(DualPathCall<Sig>& slot, const char* name);

    Status prepareStructCalls(const SymbolRegistry& registry, NativeHandle primary);

    template <typename Fn>
    Status ready(Fn* const& slot, const char* name);
    template <typename Sig>
    Status ready(const DualPathCall<Sig>& slot, const char* name);

    std::unique_ptr<PathResolver> resolver_;
    CallPlanCache call_plans_;

    // 标量与指针签名
    void (*backend_init_)() = nullptr;
    void (*backend_free_)() = nullptr;
    void (*model_free_)(llama_model*) = nullptr;
    void (*free_)(llama_context*) = nullptr;
    uint32_t (*n_ctx_)(const llama_context*) = nullptr;
    const llama_vocab* (*model_get_vocab_)(const llama_model*) = nullptr;
    int32_t (*vocab_n_tokens_)(const llama_vocab*) = nullptr;
    llama_token (*vocab_bos_)(const llama_vocab*) = nullptr;
    llama_token (*vocab_eos_)(const llama_vocab*) = nullptr;
    int32_t (*tokenize_)(const llama_vocab*, const char*, int32_t, llama_token*, int32_t,
                         bool, bool) = nullptr;
    int32_t (*token_to_piece_)(const llama_vocab*, llama_token, char*, int32_t, int32_t,
                               bool) = nullptr;
    float* (*get_logits_)(llama_context*) = nullptr;
    float* (*get_logits_ith_)(llama_context*, int32_t) = nullptr;
    void (*sampler_chain_add_)(llama_sampler*, llama_sampler*) = nullptr;
    llama_sampler* (*sampler_init_greedy_)() = nullptr;
    llama_token (*sampler_sample_)(llama_sampler*, llama_context*, int32_t) = nullptr;
    void (*sampler_free_)(llama_sampler*) = nullptr;
    bool (*supports_mmap_)() = nullptr;
    bool (*supports_mlock_)() = nullptr;
    bool (*supports_gpu_offload_)() = nullptr;
    bool (*supports_rpc_)() = nullptr;
    size_t (*max_devices_)() = nullptr;
    const char* (*print_system_info_)() = nullptr;

    size_t (*ggml_type_size_)(int32_t) = nullptr;
    const char* (*ggml_type_name_)(int32_t) = nullptr;
    size_t (*ggml_backend_dev_count_)() = nullptr;
    ggml_backend_buffer_type_t (*ggml_backend_cpu_buffer_type_)() = nullptr;
    void (*ggml_backend_load_all_)() = nullptr;
    ggml_backend_t (*ggml_backend_cuda_init_)(int) = nullptr;
    ggml_backend_t (*ggml_backend_metal_init_)() = nullptr;
    ggml_backend_t (*ggml_backend_vk_init_)(size_t) = nullptr;

    // 结构体按值签名
    DualPathCall<llama_model_params()> model_default_params_;
    DualPathCall<llama_context_params()> context_default_params_;
    DualPathCall<llama_sampler_chain_params()> sampler_chain_default_params_;
    DualPathCall<llama_model*(const char*, llama_model_params)> model_load_from_file_;
    DualPathCall<llama_context*(llama_model*, llama_context_params)> init_from_model_;
    DualPathCall<llama_batch(int32_t, int32_t, int32_t)> batch_init_;
    DualPathCall<llama_batch(llama_token*, int32_t)> batch_get_one_;
    DualPathCall<void(llama_batch)> batch_free_;
    DualPathCall<int32_t(llama_context*, llama_batch)> decode_;
    DualPathCall<int32_t(llama_context*, llama_batch)> encode_;
    DualPathCall<llama_sampler*(llama_sampler_chain_params)> sampler_chain_init_;

    std::vector<BindSpec> specs_;
    std::vector<PlannedSpec> planned_;

    // 最后声明：析构时先于函数槽卸载
    LibraryLoader loader_;
};

} // namespace llamaload
