// llamaload - Mirrored llama.cpp ABI Types
#pragma once

#include "call_interface.hpp"
#include <cstddef>
#include <cstdint>

namespace llamaload {

// 与 llama.h (b6862) 的声明保持逐字段一致
struct llama_model;
struct llama_context;
struct llama_vocab;
struct llama_sampler;
struct ggml_backend;
struct ggml_backend_buffer_type;

using ggml_backend_t = ggml_backend*;
using ggml_backend_buffer_type_t = ggml_backend_buffer_type*;

using llama_token = int32_t;
using llama_pos = int32_t;
using llama_seq_id = int32_t;

struct llama_model_params {
    void* devices;
    const void* tensor_buft_overrides;

    int32_t n_gpu_layers;
    int32_t split_mode;     // enum llama_split_mode
    int32_t main_gpu;

    const float* tensor_split;

    void* progress_callback;
    void* progress_callback_user_data;

    const void* kv_overrides;

    bool vocab_only;
    bool use_mmap;
    bool use_mlock;
    bool check_tensors;
    bool use_extra_bufts;
};

struct llama_context_params {
    uint32_t n_ctx;
    uint32_t n_batch;
    uint32_t n_ubatch;
    uint32_t n_seq_max;
    int32_t  n_threads;
    int32_t  n_threads_batch;

    int32_t rope_scaling_type;  // enum llama_rope_scaling_type
    int32_t pooling_type;       // enum llama_pooling_type
    int32_t attention_type;     // enum llama_attention_type
    int32_t flash_attn_type;    // enum llama_flash_attn_type

    float    rope_freq_base;
    float    rope_freq_scale;
    float    yarn_ext_factor;
    float    yarn_attn_factor;
    float    yarn_beta_fast;
    float    yarn_beta_slow;
    uint32_t yarn_orig_ctx;
    float    defrag_thold;

    void* cb_eval;
    void* cb_eval_user_data;

    int32_t type_k;             // enum ggml_type
    int32_t type_v;

    void* abort_callback;
    void* abort_callback_data;

    bool embeddings;
    bool offload_kqv;
    bool no_perf;
    bool op_offload;
    bool swa_full;
    bool kv_unified;
};

struct llama_sampler_chain_params {
    bool no_perf;
};

struct llama_batch {
    int32_t n_tokens;

    llama_token*   token;
    float*         embd;
    llama_pos*     pos;
    int32_t*       n_seq_id;
    llama_seq_id** seq_id;
    int8_t*        logits;
};

// 上述结构体的调用描述
template <>
struct AbiType<llama_model_params> {
    static ValueType get();
};

template <>
struct AbiType<llama_context_params> {
    static ValueType get();
};

template <>
struct AbiType<llama_sampler_chain_params> {
    static ValueType get();
};

template <>
struct AbiType<llama_batch> {
    static ValueType get();
};

} // namespace llamaload
