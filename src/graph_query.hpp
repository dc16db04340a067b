#ifndef GFAESTUS_GRAPH_QUERY_HPP_INCLUDED
#define GFAESTUS_GRAPH_QUERY_HPP_INCLUDED

/** \file
 * graph_query.hpp: shared read-only access to a loaded graph and its path
 * index, both through a dedicated request thread and through a thread pool.
 */

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <functional>
#include <type_traits>

#include "handle.hpp"
#include "path_position_index.hpp"
#include "channel.hpp"
#include "thread_pool.hpp"
#include "async_result.hpp"
#include "overlays.hpp"

namespace gfaestus {

using namespace std;

enum class GraphQueryKind {
    GraphStats,
    NodeStats,
    PathStats,
    NodeSeq
};

/**
 * Answer to a GraphQueryRequest. Only the fields for the request's kind are
 * filled in.
 */
struct GraphQueryResponse {
    GraphQueryKind kind = GraphQueryKind::GraphStats;

    // GraphStats
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t path_count = 0;
    size_t total_len = 0;

    // NodeStats and NodeSeq. found is false if the graph doesn't have the
    // node or path asked about.
    bool found = false;
    nid_t node_id = 0;
    size_t len = 0;
    size_t degree_left = 0;
    size_t degree_right = 0;
    size_t coverage = 0;
    string sequence;

    // PathStats
    path_handle_t path = handlegraph::as_path_handle(0);
    string path_name;
    size_t step_count = 0;
    size_t base_len = 0;
};

/**
 * Question for the request thread. Each request carries the channel its
 * answer goes back on.
 */
struct GraphQueryRequest {
    GraphQueryKind kind = GraphQueryKind::GraphStats;
    nid_t node_id = 0;
    path_handle_t path = handlegraph::as_path_handle(0);
    shared_ptr<Channel<GraphQueryResponse>> reply;

    static GraphQueryRequest graph_stats();
    static GraphQueryRequest node_stats(nid_t node_id);
    static GraphQueryRequest path_stats(const path_handle_t& path);
    static GraphQueryRequest node_seq(nid_t node_id);
};

/**
 * Owns the graph's path position index and a thread that answers
 * GraphQueryRequests one at a time, in the order they arrive. Everything else
 * here is const and can be called from any thread.
 */
class GraphQuery {
public:
    /// Index the graph and start the request thread.
    GraphQuery(const shared_ptr<const PathHandleGraph>& graph);

    /// Stop the request thread and wait for it.
    ~GraphQuery();

    GraphQuery(const GraphQuery& other) = delete;
    GraphQuery& operator=(const GraphQuery& other) = delete;

    const PathHandleGraph& graph() const;

    const shared_ptr<const PathHandleGraph>& graph_ptr() const;

    const PathPositionIndex& path_positions() const;

    /// Send a request to the request thread and wait for the answer. Throws
    /// runtime_error if the thread has shut down.
    GraphQueryResponse query_request_blocking(GraphQueryRequest request);

    /// Answer a request right here, without the request thread.
    GraphQueryResponse answer(const GraphQueryRequest& request) const;

    /// Get the steps of a path with their base offsets.
    const vector<StepPosition>& path_pos_steps(const path_handle_t& path) const;

    /// Get the steps of a path with ranks in [start_rank, end_rank]. The end is
    /// clamped to the end of the path.
    vector<StepPosition> path_range(const path_handle_t& path, size_t start_rank, size_t end_rank) const;

    /**
     * Get the steps of a path covering the bases in [start_bp, end_bp). Runs
     * from the first step that ends after start_bp to the first one that ends
     * at or after end_bp, or the last step of the path. Empty if start_bp is
     * past the end of the path.
     */
    vector<StepPosition> path_basepair_range(const path_handle_t& path, size_t start_bp, size_t end_bp) const;

    /// Color each node with the given function, in node ID order.
    vector<RGBA> build_overlay_colors(const function<RGBA(const PathHandleGraph&, const handle_t&)>& color_of) const;

    /// Get a value for each node with the given function, in node ID order.
    vector<float> build_overlay_values(const function<float(const PathHandleGraph&, const handle_t&)>& value_of) const;

private:

    /// Run the request thread until the request channel is closed.
    void serve_requests();

    /// Get all the handles in ID order.
    vector<handle_t> sorted_handles() const;

    shared_ptr<const PathHandleGraph> graph_handle;
    PathPositionIndex index;
    /// Rendezvous channel, so senders wait until the thread takes their request
    Channel<GraphQueryRequest> requests;
    thread request_thread;
};

/**
 * Runs queries against a shared GraphQuery on a pool of threads, handing back
 * AsyncResults to poll.
 */
class GraphQueryWorker {
public:
    GraphQueryWorker(const shared_ptr<GraphQuery>& query, size_t thread_count);

    /// Run a function of the GraphQuery on the pool.
    template<typename F>
    AsyncResult<invoke_result_t<F, shared_ptr<const GraphQuery>>> run_query(F&& query_function);

    shared_ptr<const GraphQuery> graph_query() const;

private:
    shared_ptr<GraphQuery> query;
    ThreadPool pool;
};

template<typename F>
AsyncResult<invoke_result_t<F, shared_ptr<const GraphQuery>>> GraphQueryWorker::run_query(F&& query_function) {
    shared_ptr<const GraphQuery> shared_query = query;
    return run_async(pool, [shared_query, query_function = std::forward<F>(query_function)]() mutable {
        return query_function(shared_query);
    });
}

}

#endif
