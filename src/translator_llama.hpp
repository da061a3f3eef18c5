#pragma once

#include "translator.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace pseudo_mt {

struct LlamaTranslatorConfig {
    std::string model_path;
    int n_ctx = 4096;
    int n_gpu_layers = -1;
    int n_threads = 8;
    int max_tokens = 384;
    // Upper bound on context text placed in the prompt.
    std::size_t max_context_chars = 2048;
};

// Translator backed by a local GGUF model through llama.cpp. Clones share
// the loaded model; each clone owns its own context and sampler, so one
// clone must not be used from two threads at once.
class LlamaTranslator final : public Translator {
public:
    explicit LlamaTranslator(LlamaTranslatorConfig config);
    ~LlamaTranslator() override;

    std::unique_ptr<Translator> clone() const override;
    std::string translate(const std::string& instruction, const TranslationContext& context) override;

private:
    struct SharedModel;

    LlamaTranslator(LlamaTranslatorConfig config, std::shared_ptr<SharedModel> shared_model);

    static std::shared_ptr<SharedModel> load_shared_model(const LlamaTranslatorConfig& config);

    std::string build_prompt(const std::string& instruction, const TranslationContext& context) const;
    std::string postprocess_translation(std::string text, const std::string& instruction) const;
    bool has_early_stop_marker(const std::string& generated) const;

    std::vector<int32_t> tokenize(const std::string& text, bool add_special, bool parse_special) const;
    std::string token_to_piece(int32_t token) const;

    void ensure_context_ready();

    LlamaTranslatorConfig config_;
    std::shared_ptr<SharedModel> shared_model_;

    llama_context* ctx_ = nullptr;
    llama_sampler* sampler_ = nullptr;
};

}  // namespace pseudo_mt
