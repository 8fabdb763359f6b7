// llamaload - Mirrored llama.cpp ABI Types Implementation

#include "llama_types.hpp"

namespace llamaload {

// 字段按声明顺序逐一列出，bool 以 u8 描述
ValueType AbiType<llama_model_params>::get() {
    static const std::shared_ptr<const StructLayout> layout = StructLayout::describe({
        FieldTag::Pointer,  // devices
        FieldTag::Pointer,  // tensor_buft_overrides
        FieldTag::Int32,    // n_gpu_layers
        FieldTag::Int32,    // split_mode
        FieldTag::Int32,    // main_gpu
        FieldTag::Pointer,  // tensor_split
        FieldTag::Pointer,  // progress_callback
        FieldTag::Pointer,  // progress_callback_user_data
        FieldTag::Pointer,  // kv_overrides
        FieldTag::UInt8,    // vocab_only
        FieldTag::UInt8,    // use_mmap
        FieldTag::UInt8,    // use_mlock
        FieldTag::UInt8,    // check_tensors
        FieldTag::UInt8,    // use_extra_bufts
    });
    return layout;
}

ValueType AbiType<llama_context_params>::get() {
    static const std::shared_ptr<const StructLayout> layout = StructLayout::describe({
        FieldTag::UInt32,   // n_ctx
        FieldTag::UInt32,   // n_batch
        FieldTag::UInt32,   // n_ubatch
        FieldTag::UInt32,   // n_seq_max
        FieldTag::Int32,    // n_threads
        FieldTag::Int32,    // n_threads_batch
        FieldTag::Int32,    // rope_scaling_type
        FieldTag::Int32,    // pooling_type
        FieldTag::Int32,    // attention_type
        FieldTag::Int32,    // flash_attn_type
        FieldTag::Float,    // rope_freq_base
        FieldTag::Float,    // rope_freq_scale
        FieldTag::Float,    // yarn_ext_factor
        FieldTag::Float,    // yarn_attn_factor
        FieldTag::Float,    // yarn_beta_fast
        FieldTag::Float,    // yarn_beta_slow
        FieldTag::UInt32,   // yarn_orig_ctx
        FieldTag::Float,    // defrag_thold
        FieldTag::Pointer,  // cb_eval
        FieldTag::Pointer,  // cb_eval_user_data
        FieldTag::Int32,    // type_k
        FieldTag::Int32,    // type_v
        FieldTag::Pointer,  // abort_callback
        FieldTag::Pointer,  // abort_callback_data
        FieldTag::UInt8,    // embeddings
        FieldTag::UInt8,    // offload_kqv
        FieldTag::UInt8,    // no_perf
        FieldTag::UInt8,    // op_offload
        FieldTag::UInt8,    // swa_full
        FieldTag::UInt8,    // kv_unified
    });
    return layout;
}

ValueType AbiType<llama_sampler_chain_params>::get() {
    static const std::shared_ptr<const StructLayout> layout = StructLayout::describe({
        FieldTag::UInt8,    // no_perf
    });
    return layout;
}

ValueType AbiType<llama_batch>::get() {
    static const std::shared_ptr<const StructLayout> layout = StructLayout::describe({
        FieldTag::Int32,    // n_tokens
        FieldTag::Pointer,  // token
        FieldTag::Pointer,  // embd
        FieldTag::Pointer,  // pos
        FieldTag::Pointer,  // n_seq_id
        FieldTag::Pointer,  // seq_id
        FieldTag::Pointer,  // logits
    });
    return layout;
}

} // namespace llamaload
