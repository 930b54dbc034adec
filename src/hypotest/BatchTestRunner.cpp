#include "BatchTestRunner.h"
#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include "HypothesisTestException.h"
#include "HypothesisTestRunner.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "TestInterpretation.h"

using namespace rapidjson;

namespace hypotest {

namespace {

    std::string readString(const Value& job, const char* key, const std::string& where) {
        if (!job.HasMember(key))
            return std::string();
        if (!job[key].IsString())
            throw InvalidParameterException(where + ": '" + key + "' must be a string");
        return job[key].GetString();
    }

    BatchJob parseJob(const Value& value, std::size_t index) {
        const std::string where = "Batch job " + std::to_string(index + 1);
        if (!value.IsObject())
            throw InvalidParameterException(where + " is not an object");

        BatchJob job;
        job.id = readString(value, "id", where);
        if (job.id.empty())
            job.id = "job-" + std::to_string(index + 1);

        job.test = readString(value, "test", where);
        if (job.test.empty())
            throw InvalidParameterException(where + ": missing 'test'");

        if (!value.HasMember("data"))
            throw InvalidParameterException(where + ": missing 'data'");

        const Value& data = value["data"];
        if (data.IsString()) {
            job.data = data.GetString();
        }
        else if (data.IsArray()) {
            StringBuffer buffer;
            Writer<StringBuffer> writer(buffer);
            data.Accept(writer);
            job.data = buffer.GetString();
        }
        else {
            throw InvalidParameterException(where + ": 'data' must be a string or an array");
        }

        if (value.HasMember("alpha")) {
            if (!value["alpha"].IsNumber())
                throw InvalidParameterException(where + ": 'alpha' must be a number");
            job.alpha = value["alpha"].GetDouble();
        }

        job.nullHypothesis = readString(value, "null_hypothesis", where);
        job.alternativeHypothesis = readString(value, "alternative_hypothesis", where);
        return job;
    }
}

BatchTestRunner::BatchTestRunner(const EngineConfiguration& config)
    : config_(config) {
}

std::vector<BatchJob> BatchTestRunner::parseJobs(const std::string& json) {
    Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
        throw InvalidParameterException(std::string("Batch file JSON parse error at offset ") +
                                        std::to_string(doc.GetErrorOffset()) + ": " +
                                        GetParseError_En(doc.GetParseError()));

    const Value* jobs = nullptr;
    if (doc.IsArray()) {
        jobs = &doc;
    }
    else if (doc.IsObject() && doc.HasMember("jobs") && doc["jobs"].IsArray()) {
        jobs = &doc["jobs"];
    }
    else {
        throw InvalidParameterException("Batch file must be an array of jobs or an object with a 'jobs' array");
    }

    std::vector<BatchJob> parsed;
    parsed.reserve(jobs->Size());
    for (SizeType i = 0; i < jobs->Size(); ++i)
        parsed.push_back(parseJob((*jobs)[i], i));

    return parsed;
}

std::vector<BatchJob> BatchTestRunner::loadJobsFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw InvalidParameterException("Could not open batch file: " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJobs(buffer.str());
}

std::vector<BatchJobResult> BatchTestRunner::run(const std::vector<BatchJob>& jobs,
                                                 std::ostream& progress) const {
    std::vector<BatchJobResult> results(jobs.size());
    const HypothesisTestRunner runner(config_);

    std::mutex progressMutex;
    std::atomic<std::size_t> completed{0};
    const std::size_t total = jobs.size();

    auto executor = concurrency::makeExecutor(config_.getThreads());

    concurrency::parallel_for(total, *executor, [&](std::size_t i) {
        const BatchJob& job = jobs[i];
        BatchJobResult& slot = results[i];
        slot.id = job.id;
        slot.test = job.test;

        try {
            slot.result = runner.run(job.test, job.data, job.nullHypothesis,
                                     job.alternativeHypothesis, job.alpha);
        }
        catch (const HypothesisTestException& e) {
            slot.error = e.what();
        }
        catch (const std::exception& e) {
            slot.error = std::string("Unexpected error: ") + e.what();
        }

        const std::size_t done = ++completed;
        std::lock_guard<std::mutex> lock(progressMutex);
        progress << "[" << done << "/" << total << "] " << job.id << " (" << job.test << "): ";
        if (slot.succeeded()) {
            progress << "p=" << formatSignificant(slot.result->getPValue())
                     << (slot.result->isSignificant() ? " significant" : " not significant");
        }
        else {
            progress << "ERROR " << slot.error;
        }
        progress << std::endl;
    });

    std::size_t succeeded = 0;
    std::size_t significant = 0;
    for (const auto& r : results) {
        if (r.succeeded()) {
            ++succeeded;
            if (r.result->isSignificant())
                ++significant;
        }
    }

    progress << "Batch complete: " << succeeded << " succeeded, " << (total - succeeded)
             << " failed, " << significant << " significant" << std::endl;

    return results;
}

} // namespace hypotest
