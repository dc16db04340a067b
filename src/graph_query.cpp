#include "graph_query.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>

//#define debug

namespace gfaestus {

using namespace std;

static const Logger logger("graph-query");

GraphQueryRequest GraphQueryRequest::graph_stats() {
    GraphQueryRequest request;
    request.kind = GraphQueryKind::GraphStats;
    return request;
}

GraphQueryRequest GraphQueryRequest::node_stats(nid_t node_id) {
    GraphQueryRequest request;
    request.kind = GraphQueryKind::NodeStats;
    request.node_id = node_id;
    return request;
}

GraphQueryRequest GraphQueryRequest::path_stats(const path_handle_t& path) {
    GraphQueryRequest request;
    request.kind = GraphQueryKind::PathStats;
    request.path = path;
    return request;
}

GraphQueryRequest GraphQueryRequest::node_seq(nid_t node_id) {
    GraphQueryRequest request;
    request.kind = GraphQueryKind::NodeSeq;
    request.node_id = node_id;
    return request;
}

GraphQuery::GraphQuery(const shared_ptr<const PathHandleGraph>& graph) :
    graph_handle(graph), index(*graph), requests(0) {

    request_thread = thread([this]() {
        serve_requests();
    });
}

GraphQuery::~GraphQuery() {
    requests.close();
    request_thread.join();
}

const PathHandleGraph& GraphQuery::graph() const {
    return *graph_handle;
}

const shared_ptr<const PathHandleGraph>& GraphQuery::graph_ptr() const {
    return graph_handle;
}

const PathPositionIndex& GraphQuery::path_positions() const {
    return index;
}

void GraphQuery::serve_requests() {
    GraphQueryRequest request;
    while (requests.recv(request)) {
#ifdef debug
        cerr << "Request thread got a request of kind " << (int) request.kind << endl;
#endif
        GraphQueryResponse response = answer(request);
        if (request.reply) {
            // Reply channels have room for the one answer, so this won't wait.
            if (!request.reply->send(std::move(response))) {
                logger.warn() << "could not deliver an answer to a closed reply channel" << endl;
            }
        }
        request.reply.reset();
    }
#ifdef debug
    cerr << "Request thread shutting down" << endl;
#endif
}

GraphQueryResponse GraphQuery::query_request_blocking(GraphQueryRequest request) {
    auto reply = make_shared<Channel<GraphQueryResponse>>(1);
    request.reply = reply;

    if (!requests.send(std::move(request))) {
        throw runtime_error("graph query thread has shut down");
    }

    GraphQueryResponse response;
    if (!reply->recv(response)) {
        throw runtime_error("graph query thread shut down without answering");
    }
    return response;
}

GraphQueryResponse GraphQuery::answer(const GraphQueryRequest& request) const {
    const PathHandleGraph& g = *graph_handle;

    GraphQueryResponse response;
    response.kind = request.kind;

    switch (request.kind) {
    case GraphQueryKind::GraphStats:
        response.node_count = g.get_node_count();
        response.edge_count = g.get_edge_count();
        response.path_count = g.get_path_count();
        response.total_len = g.get_total_length();
        response.found = true;
        break;
    case GraphQueryKind::NodeStats:
        response.node_id = request.node_id;
        if (g.has_node(request.node_id)) {
            handle_t handle = g.get_handle(request.node_id, false);
            response.found = true;
            response.len = g.get_length(handle);
            response.degree_left = g.get_degree(handle, true);
            response.degree_right = g.get_degree(handle, false);
            response.coverage = node_coverage(g, handle);
        }
        break;
    case GraphQueryKind::PathStats:
        response.path = request.path;
        if (index.has_path(request.path)) {
            response.found = true;
            response.path_name = g.get_path_name(request.path);
            response.step_count = index.path_steps(request.path).size();
            response.base_len = index.path_base_len(request.path);
        }
        break;
    case GraphQueryKind::NodeSeq:
        response.node_id = request.node_id;
        if (g.has_node(request.node_id)) {
            response.found = true;
            response.sequence = g.get_sequence(g.get_handle(request.node_id, false));
        }
        break;
    }

    return response;
}

const vector<StepPosition>& GraphQuery::path_pos_steps(const path_handle_t& path) const {
    return index.path_steps(path);
}

vector<StepPosition> GraphQuery::path_range(const path_handle_t& path, size_t start_rank, size_t end_rank) const {
    auto& steps = index.path_steps(path);
    if (steps.empty() || start_rank > end_rank || start_rank >= steps.size()) {
        return vector<StepPosition>();
    }
    end_rank = min(end_rank, steps.size() - 1);
    return vector<StepPosition>(steps.begin() + start_rank, steps.begin() + end_rank + 1);
}

vector<StepPosition> GraphQuery::path_basepair_range(const path_handle_t& path, size_t start_bp, size_t end_bp) const {
    auto& steps = index.path_steps(path);

    bool have_start = false;
    size_t start_rank = 0;
    size_t end_rank = steps.empty() ? 0 : steps.size() - 1;
    for (size_t rank = 0; rank < steps.size(); rank++) {
        size_t step_end = steps[rank].offset + graph_handle->get_length(steps[rank].handle);
        if (!have_start && step_end > start_bp) {
            start_rank = rank;
            have_start = true;
        }
        if (have_start && step_end >= end_bp) {
            end_rank = rank;
            break;
        }
    }

    if (!have_start) {
        return vector<StepPosition>();
    }
    return path_range(path, start_rank, end_rank);
}

vector<handle_t> GraphQuery::sorted_handles() const {
    vector<handle_t> handles;
    handles.reserve(graph_handle->get_node_count());
    graph_handle->for_each_handle([&](const handle_t& handle) {
        handles.push_back(handle);
    });
    sort(handles.begin(), handles.end(), [&](const handle_t& a, const handle_t& b) {
        return graph_handle->get_id(a) < graph_handle->get_id(b);
    });
    return handles;
}

vector<RGBA> GraphQuery::build_overlay_colors(const function<RGBA(const PathHandleGraph&, const handle_t&)>& color_of) const {
    vector<RGBA> colors;
    for (auto& handle : sorted_handles()) {
        colors.push_back(color_of(*graph_handle, handle));
    }
    logger.info() << "built color overlay over " << colors.size() << " nodes" << endl;
    return colors;
}

vector<float> GraphQuery::build_overlay_values(const function<float(const PathHandleGraph&, const handle_t&)>& value_of) const {
    vector<float> values;
    for (auto& handle : sorted_handles()) {
        values.push_back(value_of(*graph_handle, handle));
    }
    logger.info() << "built value overlay over " << values.size() << " nodes" << endl;
    return values;
}

GraphQueryWorker::GraphQueryWorker(const shared_ptr<GraphQuery>& query, size_t thread_count) :
    query(query), pool(thread_count) {
    // Nothing to do
}

shared_ptr<const GraphQuery> GraphQueryWorker::graph_query() const {
    return query;
}

}
