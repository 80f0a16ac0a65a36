#pragma once

#include "TextProcessingTypes.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/Profile.hpp"

namespace processing {

// Runs a stage (callable returning T) and wraps its outcome in a StageResult<T>.
// Exceptions become failed results; the caller decides how to report them.
template<typename T, typename Fn>
text_processing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    auto elapsed = [&start]()
    {
        return duration_cast<microseconds>(high_resolution_clock::now() - start);
    };

    try
    {
        T res = fn();
        auto dur = elapsed();
        if (Diagnostics::IsVerbose()) {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return text_processing::StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const InvalidEncodingError& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' rejected input at byte " << ex.offset()
                                               << ": " << ex.what();
        auto failed = text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
        failed.error_offset = ex.offset();
        return failed;
    }
    catch (const std::exception& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace processing
