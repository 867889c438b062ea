#include "batch.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace submitter {
using namespace std;
using remote::submission_outcome;

batch_summary submit_batch(store::problem_store &problems, remote::submission_orchestrator &orchestrator, const batch_options &options) {
    if (options.dry_run)
        LOG(WARNING) << "Running in dry-run mode. No changes will be made to problem files";

    batch_summary summary;
    vector<string> ids = problems.list();
    LOG(INFO) << "Submitting " << ids.size() << " solutions...";

    for (size_t i = 0; i < ids.size(); ++i) {
        const string &id = ids[i];
        LOG(INFO) << "[" << i + 1 << "/" << ids.size() << "] Submitting problem " << id << " ...";
        ++summary.processed;

        store::problem prob;
        try {
            prob = problems.load(id);
        } catch (store_error &e) {
            LOG(ERROR) << "Failed to read problem: " << e.what();
            ++summary.errors;
            continue;
        }

        auto solv = prob.solutions.find(options.model);
        if (solv == prob.solutions.end()) {
            LOG(WARNING) << "Model " << options.model << " has no solution to submit";
            ++summary.skipped;
            continue;
        }
        if (solv->second.typed_code.empty()) {
            LOG(ERROR) << "Model " << options.model << " has empty solution";
            ++summary.skipped;
            continue;
        }
        auto subm = prob.submissions.find(options.model);
        if (!options.force && subm != prob.submissions.end() && subm->second.finished) {
            LOG(INFO) << options.model << "'s solution is already submitted";
            ++summary.skipped;
            continue;
        }

        remote::submission_request request;
        request.language = solv->second.lang;
        request.question_id = prob.question_id;
        request.title_slug = prob.title_slug;
        request.typed_code = solv->second.typed_code;

        LOG(INFO) << "Submitting " << options.model << "'s solution...";
        elapsed_time timer;
        submission_outcome outcome;
        try {
            outcome = orchestrator.submit_and_check(request);
        } catch (fatal_error &e) {
            LOG(ERROR) << "Aborting: " << e.what();
            ++summary.errors;
            summary.aborted = true;
            break;
        }

        if (outcome.type == submission_outcome::kind::EXHAUSTED) {
            LOG(ERROR) << "Failed to submit or check " << options.model << "'s solution: " << outcome.message;
            ++summary.errors;
            continue;
        }

        LOG(INFO) << "Submission status: " << outcome.result.status_msg << " ("
                  << remote::to_string(outcome.type) << ", " << timer.duration<chrono::seconds>().count() << "s)";
        if (!options.dry_run) {
            try {
                problems.save(id, options.model, outcome);
            } catch (store_error &e) {
                LOG(ERROR) << "Failed to save the submission result: " << e.what();
                ++summary.errors;
                continue;
            }
        }
        ++summary.submitted;
    }

    LOG(INFO) << "Files processed: " << summary.processed;
    LOG(INFO) << "Skipped problems: " << summary.skipped;
    LOG(INFO) << "Problems submitted successfully: " << summary.submitted;
    LOG(INFO) << "Errors: " << summary.errors;
    return summary;
}

}  // namespace submitter
