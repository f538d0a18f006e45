#include <app/console_conflict_presenter.hpp>

#include <fmt/format.h>

void ConsoleConflictPresenter::present(SharedData::ConflictQuestion const& question)
{
    std::lock_guard lock{mutex_};
    question_ = question;
}

std::optional<SharedData::ConflictQuestion> ConsoleConflictPresenter::takeQuestion()
{
    std::lock_guard lock{mutex_};
    auto question = std::move(question_);
    question_.reset();
    return question;
}

std::string formatConflictQuestion(SharedData::ConflictQuestion const& question)
{
    const auto kind = [](bool isDirectory) {
        return isDirectory ? "directory" : "file";
    };
    return fmt::format(
        "The {} '{}' already exists (source is a {} at '{}').\n"
        "[s]kip, [S]kip all, [r]eplace, [R]eplace all, [c]ancel? ",
        kind(question.targetIsDirectory),
        question.targetPath,
        kind(question.sourceIsDirectory),
        question.sourcePath);
}

std::optional<SharedData::ConflictDecision> parseConflictAnswer(std::string_view answer)
{
    while (!answer.empty() && (answer.back() == '\n' || answer.back() == '\r' || answer.back() == ' '))
        answer.remove_suffix(1);
    while (!answer.empty() && answer.front() == ' ')
        answer.remove_prefix(1);

    if (answer == "s" || answer == "skip")
        return SharedData::ConflictDecision::skip();
    if (answer == "S" || answer == "skip all")
        return SharedData::ConflictDecision::skipAll();
    if (answer == "r" || answer == "replace")
        return SharedData::ConflictDecision::replace();
    if (answer == "R" || answer == "replace all")
        return SharedData::ConflictDecision::replaceAll();
    if (answer == "c" || answer == "cancel")
        return SharedData::ConflictDecision::cancel();
    return std::nullopt;
}
