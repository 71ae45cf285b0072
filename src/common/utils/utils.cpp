/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <sstream>

#include <Poco/DigestEngine.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/SHA1Engine.h>
#include <Poco/StreamCopier.h>
#include <Poco/String.h>
#include <Poco/StringTokenizer.h>

#include "exception.hpp"
#include "utils.hpp"

namespace vpcctl::common::utils {

/***********************************************************************************************************************
 * Public
 **********************************************************************************************************************/

RetWithError<std::string> ExecCommand(const std::vector<std::string>& args)
{
    if (args.empty()) {
        return {"", Error(ErrorEnum::eInvalidArgument, "exec command requires at least one argument")};
    }

    LOG_DBG() << "Exec command" << Log::Field("cmd", JoinArgs(args).c_str());

    try {
        Poco::Pipe          outPipe;
        Poco::Process::Args pocoArgs(args.begin() + 1, args.end());

        Poco::ProcessHandle   ph = Poco::Process::launch(args[0], pocoArgs, nullptr, &outPipe, &outPipe);
        Poco::PipeInputStream istr(outPipe);
        std::ostringstream    output;

        Poco::StreamCopier::copyStream(istr, output);

        if (int rc = ph.wait(); rc != 0) {
            std::ostringstream err;

            err << "command `" << JoinArgs(args) << "` failed (exit=" << rc << "): " << Poco::trim(output.str());

            return {"", Error(ErrorEnum::eRuntime, err.str().c_str())};
        }

        return {output.str(), ErrorEnum::eNone};
    } catch (const std::exception& e) {
        return {"", AOS_ERROR_WRAP(ToAosError(e, ErrorEnum::eRuntime))};
    }
}

std::string JoinArgs(const std::vector<std::string>& args)
{
    std::string result;

    for (const auto& arg : args) {
        if (!result.empty()) {
            result += ' ';
        }

        result += arg;
    }

    return result;
}

std::vector<std::string> SplitLines(const std::string& output)
{
    Poco::StringTokenizer tokenizer(
        output, "\n", Poco::StringTokenizer::TOK_TRIM | Poco::StringTokenizer::TOK_IGNORE_EMPTY);

    return std::vector<std::string>(tokenizer.begin(), tokenizer.end());
}

std::string ShortHash(const std::string& value, size_t len)
{
    Poco::SHA1Engine engine;

    engine.update(value);

    return Poco::DigestEngine::digestToHex(engine.digest()).substr(0, len);
}

} // namespace vpcctl::common::utils
