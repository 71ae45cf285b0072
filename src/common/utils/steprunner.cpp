/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "steprunner.hpp"
#include "utils.hpp"

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

StepRunner::StepRunner(const std::string& operation)
    : mOperation(operation)
{
}

void StepRunner::AddStep(const std::string& name, Action&& action, Action&& inverse)
{
    mSteps.push_back({name, std::move(action), std::move(inverse)});
}

Error StepRunner::Run()
{
    for (; mNumDone < mSteps.size(); ++mNumDone) {
        const auto& step = mSteps[mNumDone];

        LOG_DBG() << "Run step" << Log::Field("operation", mOperation.c_str())
                  << Log::Field("step", step.mName.c_str());

        if (auto err = step.mAction(); !err.IsNone()) {
            auto message = mOperation + ": step '" + step.mName + "' failed";

            if (!mCompleted.empty()) {
                message += ", completed steps: " + JoinArgs(mCompleted);
            }

            message += ": " + std::string(err.Message());

            return Error(err, message.c_str());
        }

        mCompleted.push_back(step.mName);
    }

    return ErrorEnum::eNone;
}

Error StepRunner::Rollback()
{
    Error firstErr;

    for (auto i = mNumDone; i > 0; --i) {
        const auto& step = mSteps[i - 1];

        if (!step.mInverse) {
            continue;
        }

        LOG_DBG() << "Undo step" << Log::Field("operation", mOperation.c_str())
                  << Log::Field("step", step.mName.c_str());

        if (auto err = step.mInverse(); !err.IsNone()) {
            LOG_WRN() << "Undo step failed" << Log::Field("step", step.mName.c_str()) << Log::Field(err);

            if (firstErr.IsNone()) {
                firstErr = err;
            }
        }
    }

    mNumDone = 0;
    mCompleted.clear();

    return firstErr;
}

} // namespace vpcctl::common::utils
