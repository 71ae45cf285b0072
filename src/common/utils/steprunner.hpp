/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef VPCCTL_COMMON_UTILS_STEPRUNNER_HPP_
#define VPCCTL_COMMON_UTILS_STEPRUNNER_HPP_

#include <functional>
#include <string>
#include <vector>

#include <common/types/common.hpp>

namespace vpcctl::common::utils {

/**
 * Runs an ordered list of named steps, each step optionally carries an inverse action.
 *
 * Steps run forward only: the first failed step stops the sequence and completed steps stay applied. Inverse actions
 * are executed only by explicit Rollback() call.
 */
class StepRunner {
public:
    using Action = std::function<Error()>;

    /**
     * Constructor.
     *
     * @param operation operation name used in error context.
     */
    explicit StepRunner(const std::string& operation);

    /**
     * Adds step.
     *
     * @param name step name.
     * @param action step action.
     * @param inverse inverse action.
     */
    void AddStep(const std::string& name, Action&& action, Action&& inverse = nullptr);

    /**
     * Runs steps until first failure.
     *
     * @return Error.
     */
    Error Run();

    /**
     * Runs inverse actions of completed steps in reverse order.
     *
     * @return Error first inverse action error.
     */
    Error Rollback();

    /**
     * Returns names of completed steps.
     *
     * @return const std::vector<std::string>&.
     */
    const std::vector<std::string>& GetCompleted() const { return mCompleted; }

private:
    struct Step {
        std::string mName;
        Action      mAction;
        Action      mInverse;
    };

    std::string              mOperation;
    std::vector<Step>        mSteps;
    std::vector<std::string> mCompleted;
    size_t                   mNumDone {};
};

} // namespace vpcctl::common::utils

#endif
