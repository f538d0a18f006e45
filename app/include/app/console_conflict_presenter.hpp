#pragma once

#include <shared_data/file_operations/conflict.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Hands conflict questions of the transfer thread over to the console thread.
 */
class ConsoleConflictPresenter
{
  public:
    void present(SharedData::ConflictQuestion const& question);
    std::optional<SharedData::ConflictQuestion> takeQuestion();

  private:
    std::mutex mutex_{};
    std::optional<SharedData::ConflictQuestion> question_{};
};

std::string formatConflictQuestion(SharedData::ConflictQuestion const& question);

/**
 * @brief s: skip, S: skip all, r: replace, R: replace all, c: cancel.
 */
std::optional<SharedData::ConflictDecision> parseConflictAnswer(std::string_view answer);
