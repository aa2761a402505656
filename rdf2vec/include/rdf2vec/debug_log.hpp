#ifndef RDF2VEC_DEBUG_LOG_HPP
#define RDF2VEC_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace rdf2vec {
namespace debug {

// Subsystem a message comes from, printed as a tag after [DEBUG]
enum class Category {
    GRAPH,    // knowledge graph construction
    WALK,     // walk enumeration and sampling
    RELABEL,  // Weisfeiler-Lehman rounds
    EXTRACT   // per-instance canonicalization
};

inline const char* category_tag(Category category) {
    switch (category) {
        case Category::GRAPH: return "GRAPH";
        case Category::WALK: return "WALK";
        case Category::RELABEL: return "WL";
        case Category::EXTRACT: return "EXTRACT";
    }
    return "?";
}

// Receives one formatted message without trailing newline
using DebugCallback = void (*)(const char* message);

// When null, messages go to stdout
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

/**
 * Format and route one message as
 *     [DEBUG][<category>][T<thread id>] <message>
 * Messages longer than the internal buffer are truncated.
 */
inline void debug_output(Category category, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream thread_id;
    thread_id << std::this_thread::get_id();

    char full_message[1120];
    snprintf(full_message, sizeof(full_message), "[DEBUG][%s][T%s] %s",
             category_tag(category), thread_id.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace rdf2vec

// Compiled out unless RDF2VEC_ENABLE_DEBUG_OUTPUT is defined
#ifdef RDF2VEC_ENABLE_DEBUG_OUTPUT
    #define RDF2VEC_DEBUG_LOG(category, fmt, ...) \
        ::rdf2vec::debug::debug_output(::rdf2vec::debug::Category::category, fmt, ##__VA_ARGS__)
#else
    #define RDF2VEC_DEBUG_LOG(category, fmt, ...) ((void)0)
#endif

#endif // RDF2VEC_DEBUG_LOG_HPP
