#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/describe.hpp>

#include <filesystem>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(ConflictAction, Skip, Replace, Cancel);
    BOOST_DEFINE_ENUM_CLASS(ConflictScope, ThisItemOnly, AllRemaining);

    /**
     * @brief The answer of the user to an existing target.
     */
    struct ConflictDecision
    {
        ConflictAction action{ConflictAction::Skip};
        ConflictScope scope{ConflictScope::ThisItemOnly};

        static ConflictDecision skip()
        {
            return {.action = ConflictAction::Skip, .scope = ConflictScope::ThisItemOnly};
        }
        static ConflictDecision skipAll()
        {
            return {.action = ConflictAction::Skip, .scope = ConflictScope::AllRemaining};
        }
        static ConflictDecision replace()
        {
            return {.action = ConflictAction::Replace, .scope = ConflictScope::ThisItemOnly};
        }
        static ConflictDecision replaceAll()
        {
            return {.action = ConflictAction::Replace, .scope = ConflictScope::AllRemaining};
        }
        static ConflictDecision cancel()
        {
            return {.action = ConflictAction::Cancel, .scope = ConflictScope::ThisItemOnly};
        }
    };
    BOOST_DESCRIBE_STRUCT(ConflictDecision, (), (action, scope))

    /**
     * @brief What is presented to the user when a target already exists.
     */
    struct ConflictQuestion
    {
        std::string displayName{};
        std::string sourcePath{};
        std::string targetPath{};
        bool sourceIsDirectory{false};
        bool targetIsDirectory{false};
    };
    BOOST_DESCRIBE_STRUCT(ConflictQuestion, (), (displayName, sourcePath, targetPath, sourceIsDirectory, targetIsDirectory))
}
