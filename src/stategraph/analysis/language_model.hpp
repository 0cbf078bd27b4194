/**
 * @file language_model.hpp
 * @brief ILanguageModel collaborator interface.
 */
#pragma once
#include "stategraph/common/common.hpp"

namespace stategraph
{

struct ChatMessage
{
    std::string role;
    std::string content;
};

/**
 * @brief Chat-style text generation backend.
 *
 * @par Thread Safety
 * The analyst nodes run concurrently and share one model; implementations
 * must accept concurrent chat() calls.
 */
class ILanguageModel
{
public:
    virtual ~ILanguageModel() = default;

    /**
     * @brief Send a conversation to a model and return the reply text.
     * @throws Any exception on transport or model failure; it fails the calling node.
     */
    virtual std::string chat(const std::string& model, const std::vector<ChatMessage>& messages) = 0;
};

using LanguageModelPtr = std::shared_ptr<ILanguageModel>;

} // namespace stategraph
