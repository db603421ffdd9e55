#include "../include/relatedness.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_set>

double jaccard_index(const std::set<std::string>& a, const std::set<std::string>& b) {
    std::vector<std::string> inter;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(inter));
    size_t uni = a.size() + b.size() - inter.size();
    if (uni == 0) return 0.0;
    return (double)inter.size() / (double)uni;
}

std::string document_title(const DocumentRecord& doc) {
    auto it = doc.metadata.find("title");
    if (it != doc.metadata.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    return doc.document_id;
}

static std::string document_year(const DocumentRecord& doc) {
    auto it = doc.metadata.find("creation_date");
    if (it == doc.metadata.end() || it->is_null()) return "Unknown";
    if (it->is_string()) return it->get<std::string>().empty() ? "Unknown" : it->get<std::string>();
    return it->dump();
}

RelatednessAggregator::RelatednessAggregator(const CorpusStore& corpus) : corpus_(corpus) {}

std::vector<RelatedDocument> RelatednessAggregator::related(const std::string& document_id) const {
    auto target = corpus_.get(document_id);
    std::vector<RelatedDocument> out;
    if (target->topics.empty()) return out;

    for (const auto& other : corpus_.documents()) {
        if (other->document_id == document_id) continue;
        RelatedDocument r;
        std::set_intersection(target->topics.begin(), target->topics.end(),
                              other->topics.begin(), other->topics.end(),
                              std::back_inserter(r.common_topics));
        if (r.common_topics.empty()) continue;
        r.document_id = other->document_id;
        r.title = document_title(*other);
        r.score = jaccard_index(target->topics, other->topics);
        out.push_back(std::move(r));
    }
    std::sort(out.begin(), out.end(), [](const RelatedDocument& a, const RelatedDocument& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.document_id < b.document_id;
    });
    if (out.size() > kMaxRelated) out.resize(kMaxRelated);
    return out;
}

std::vector<PaperDigest> RelatednessAggregator::synthesis_input(const std::vector<std::string>& document_ids) const {
    std::vector<PaperDigest> out;
    std::unordered_set<std::string> seen;
    for (const auto& id : document_ids) {
        // Repeated ids yield one digest.
        if (!seen.insert(id).second) continue;
        auto doc = corpus_.find(id);
        if (!doc) continue;

        PaperDigest p;
        p.document_id = doc->document_id;
        p.title = document_title(*doc);
        p.year = document_year(*doc);
        p.topics = doc->topics;
        // Document order: the last matching section wins.
        for (const auto& kv : doc->sections) {
            if (contains_ci(kv.first, "finding") || contains_ci(kv.first, "result")) {
                p.findings = utf8_truncate(kv.second, kMaxFieldChars);
            } else if (contains_ci(kv.first, "method")) {
                p.methods = utf8_truncate(kv.second, kMaxFieldChars);
            }
        }
        out.push_back(std::move(p));
    }
    if (out.empty()) throw RagError(ErrorCode::NoValidDocuments, "none of the requested documents are in the corpus");
    return out;
}
