//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef STAMPEDE_DEFERRED_EXECUTOR_LOGGING
#define STAMPEDE_DEFERRED_EXECUTOR_LOGGING

#include <string>
#include <sstream>
#include <ostream>
#include <memory>
#include <chrono>
#include <ratio>
#include <typeinfo>
#include <type_traits>

#include "loguru.hpp"
#include "utility.hpp"
#include "chrono.hpp"

/**
 User source code compile time macro determining compiled log code. Code
 logging beneath the specified limit is not compiled at all, every statement
 resolves to `(void)0`.

 Setting SDELOGLIMIT to -9 removes every log statement in the library. Values
 above -1 are mostly useful while debugging the library itself, because the
 executor logs every enqueue and every executed task at the lower
 criticalities, and a stampede of thousands of tasks produces a stampede of
 loglines.

 `CONSTRUCTOR`, `DESTRUCTOR` and `METHOD` macros can *only* be called by
 implementations of `sde::printable`, they print the object's name, address
 and content. `FUNCTION` and `LOG` macros can be called anywhere.

 `ENTER` macros interpret their arguments as the arguments of the entered
 function:
 SDE_INFO_FUNCTION_ENTER("my_function", "string", 3);
 my_function(string, 3)

 `BODY` macros concatenate their arguments into a single logline:
 SDE_INFO_FUNCTION_BODY("my_function", "drained ", 3, " tasks");
 my_function():drained 3 tasks

 `LOG` macros accept a `printf()` style format string and arguments.
 */
#ifndef SDELOGLIMIT
#define SDELOGLIMIT -1
#endif

#if SDELOGLIMIT < -9
#undef SDELOGLIMIT
#define SDELOGLIMIT -9
#endif

#if SDELOGLIMIT > 9
#undef SDELOGLIMIT
#define SDELOGLIMIT 9
#endif

#if SDELOGLIMIT >= -2
#define SDE_ERROR_CONSTRUCTOR(...) sde::logger::constructor(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_ERROR_DESTRUCTOR() sde::logger::destructor(this, loguru::Verbosity_ERROR, __FILE__, __LINE__)
#define SDE_ERROR_METHOD_ENTER(...) sde::logger::method_enter(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_ERROR_METHOD_BODY(...) sde::logger::method_body(this, loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_ERROR_FUNCTION_ENTER(...) sde::logger::function_enter(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_ERROR_FUNCTION_BODY(...) sde::logger::function_body(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_ERROR_LOG(...) loguru::log(loguru::Verbosity_ERROR, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_ERROR_CONSTRUCTOR(...) (void)0
#define SDE_ERROR_DESTRUCTOR() (void)0
#define SDE_ERROR_METHOD_ENTER(...) (void)0
#define SDE_ERROR_METHOD_BODY(...) (void)0
#define SDE_ERROR_FUNCTION_ENTER(...) (void)0
#define SDE_ERROR_FUNCTION_BODY(...) (void)0
#define SDE_ERROR_LOG(...) (void)0
#endif

#if SDELOGLIMIT >= -1
#define SDE_WARNING_CONSTRUCTOR(...) sde::logger::constructor(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_WARNING_DESTRUCTOR() sde::logger::destructor(this, loguru::Verbosity_WARNING, __FILE__, __LINE__)
#define SDE_WARNING_METHOD_ENTER(...) sde::logger::method_enter(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_WARNING_METHOD_BODY(...) sde::logger::method_body(this, loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_WARNING_FUNCTION_ENTER(...) sde::logger::function_enter(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_WARNING_FUNCTION_BODY(...) sde::logger::function_body(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_WARNING_LOG(...) loguru::log(loguru::Verbosity_WARNING, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_WARNING_CONSTRUCTOR(...) (void)0
#define SDE_WARNING_DESTRUCTOR() (void)0
#define SDE_WARNING_METHOD_ENTER(...) (void)0
#define SDE_WARNING_METHOD_BODY(...) (void)0
#define SDE_WARNING_FUNCTION_ENTER(...) (void)0
#define SDE_WARNING_FUNCTION_BODY(...) (void)0
#define SDE_WARNING_LOG(...) (void)0
#endif

#if SDELOGLIMIT >= 0
#define SDE_INFO_CONSTRUCTOR(...) sde::logger::constructor(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_INFO_DESTRUCTOR() sde::logger::destructor(this, loguru::Verbosity_INFO, __FILE__, __LINE__)
#define SDE_INFO_METHOD_ENTER(...) sde::logger::method_enter(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_INFO_METHOD_BODY(...) sde::logger::method_body(this, loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_INFO_FUNCTION_ENTER(...) sde::logger::function_enter(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_INFO_FUNCTION_BODY(...) sde::logger::function_body(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_INFO_LOG(...) loguru::log(loguru::Verbosity_INFO, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_INFO_CONSTRUCTOR(...) (void)0
#define SDE_INFO_DESTRUCTOR() (void)0
#define SDE_INFO_METHOD_ENTER(...) (void)0
#define SDE_INFO_METHOD_BODY(...) (void)0
#define SDE_INFO_FUNCTION_ENTER(...) (void)0
#define SDE_INFO_FUNCTION_BODY(...) (void)0
#define SDE_INFO_LOG(...) (void)0
#endif

// high criticality lifecycle
#if SDELOGLIMIT >= 1
#define SDE_HIGH_CONSTRUCTOR(...) sde::logger::constructor(this, 1, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_HIGH_DESTRUCTOR() sde::logger::destructor(this, 1, __FILE__, __LINE__)
#else
#define SDE_HIGH_CONSTRUCTOR(...) (void)0
#define SDE_HIGH_DESTRUCTOR() (void)0
#endif

// high criticality functions and methods
#if SDELOGLIMIT >= 2
#define SDE_HIGH_METHOD_ENTER(...) sde::logger::method_enter(this, 2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_HIGH_METHOD_BODY(...) sde::logger::method_body(this, 2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_HIGH_FUNCTION_ENTER(...) sde::logger::function_enter(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_HIGH_FUNCTION_BODY(...) sde::logger::function_body(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_HIGH_LOG(...) loguru::log(2, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_HIGH_METHOD_ENTER(...) (void)0
#define SDE_HIGH_METHOD_BODY(...) (void)0
#define SDE_HIGH_FUNCTION_ENTER(...) (void)0
#define SDE_HIGH_FUNCTION_BODY(...) (void)0
#define SDE_HIGH_LOG(...) (void)0
#endif

// medium criticality lifecycle
#if SDELOGLIMIT >= 3
#define SDE_MED_CONSTRUCTOR(...) sde::logger::constructor(this, 3, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MED_DESTRUCTOR() sde::logger::destructor(this, 3, __FILE__, __LINE__)
#else
#define SDE_MED_CONSTRUCTOR(...) (void)0
#define SDE_MED_DESTRUCTOR() (void)0
#endif

// medium criticality functions and methods
#if SDELOGLIMIT >= 4
#define SDE_MED_METHOD_ENTER(...) sde::logger::method_enter(this, 4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MED_METHOD_BODY(...) sde::logger::method_body(this, 4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MED_FUNCTION_ENTER(...) sde::logger::function_enter(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MED_FUNCTION_BODY(...) sde::logger::function_body(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MED_LOG(...) loguru::log(4, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_MED_METHOD_ENTER(...) (void)0
#define SDE_MED_METHOD_BODY(...) (void)0
#define SDE_MED_FUNCTION_ENTER(...) (void)0
#define SDE_MED_FUNCTION_BODY(...) (void)0
#define SDE_MED_LOG(...) (void)0
#endif

// low criticality lifecycle
#if SDELOGLIMIT >= 5
#define SDE_LOW_CONSTRUCTOR(...) sde::logger::constructor(this, 5, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_LOW_DESTRUCTOR() sde::logger::destructor(this, 5, __FILE__, __LINE__)
#else
#define SDE_LOW_CONSTRUCTOR(...) (void)0
#define SDE_LOW_DESTRUCTOR() (void)0
#endif

// low criticality functions and methods
#if SDELOGLIMIT >= 6
#define SDE_LOW_METHOD_ENTER(...) sde::logger::method_enter(this, 6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_LOW_METHOD_BODY(...) sde::logger::method_body(this, 6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_LOW_FUNCTION_ENTER(...) sde::logger::function_enter(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_LOW_FUNCTION_BODY(...) sde::logger::function_body(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_LOW_LOG(...) loguru::log(6, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_LOW_METHOD_ENTER(...) (void)0
#define SDE_LOW_METHOD_BODY(...) (void)0
#define SDE_LOW_FUNCTION_ENTER(...) (void)0
#define SDE_LOW_FUNCTION_BODY(...) (void)0
#define SDE_LOW_LOG(...) (void)0
#endif

// minimal criticality lifecycle
#if SDELOGLIMIT >= 7
#define SDE_MIN_CONSTRUCTOR(...) sde::logger::constructor(this, 7, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MIN_DESTRUCTOR() sde::logger::destructor(this, 7, __FILE__, __LINE__)
#else
#define SDE_MIN_CONSTRUCTOR(...) (void)0
#define SDE_MIN_DESTRUCTOR() (void)0
#endif

// minimal criticality functions and methods
#if SDELOGLIMIT >= 8
#define SDE_MIN_METHOD_ENTER(...) sde::logger::method_enter(this, 8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MIN_METHOD_BODY(...) sde::logger::method_body(this, 8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MIN_FUNCTION_ENTER(...) sde::logger::function_enter(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MIN_FUNCTION_BODY(...) sde::logger::function_body(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_MIN_LOG(...) loguru::log(8, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_MIN_METHOD_ENTER(...) (void)0
#define SDE_MIN_METHOD_BODY(...) (void)0
#define SDE_MIN_FUNCTION_ENTER(...) (void)0
#define SDE_MIN_FUNCTION_BODY(...) (void)0
#define SDE_MIN_LOG(...) (void)0
#endif

// per-task and per-container-operation noise
#if SDELOGLIMIT >= 9
#define SDE_TRACE_CONSTRUCTOR(...) sde::logger::constructor(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_TRACE_DESTRUCTOR() sde::logger::destructor(this, 9, __FILE__, __LINE__)
#define SDE_TRACE_METHOD_ENTER(...) sde::logger::method_enter(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_TRACE_METHOD_BODY(...) sde::logger::method_body(this, 9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_TRACE_FUNCTION_ENTER(...) sde::logger::function_enter(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_TRACE_FUNCTION_BODY(...) sde::logger::function_body(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define SDE_TRACE_LOG(...) loguru::log(9, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#else
#define SDE_TRACE_CONSTRUCTOR(...) (void)0
#define SDE_TRACE_DESTRUCTOR() (void)0
#define SDE_TRACE_METHOD_ENTER(...) (void)0
#define SDE_TRACE_METHOD_BODY(...) (void)0
#define SDE_TRACE_FUNCTION_ENTER(...) (void)0
#define SDE_TRACE_FUNCTION_BODY(...) (void)0
#define SDE_TRACE_LOG(...) (void)0
#endif

namespace sde {

/*
 Logging of object instances is enabled by that object implementing the
 `sde::printable` interface. Implementations generally rely on
 `sde::type::info` specializations, or a `static std::string info_name()`, to
 acquire type name strings.
 */
namespace type {

/// acquire the base name of an object without namespace or template text
inline std::string basename(std::string name) {
    size_t pos = name.rfind("::");

    if (pos != std::string::npos) [[likely]] {
        name = name.substr(pos + 2);
    }

    size_t open_pos = name.rfind('<');
    size_t close_pos = name.rfind('>');

    if (open_pos != std::string::npos &&
        close_pos != std::string::npos &&
        open_pos < close_pos)
    {
        name = name.substr(0, open_pos);
    }

    return name;
}

/**
 @brief a general template for acquiring a type `T`'s stringified name

 If no specialization exists and `T` has no `static std::string info_name()`,
 the compiler's `typeid(T).name()` is the fallback.
 */
template <typename T, typename = void>
struct info {
    static inline std::string name(){ return typeid(T).name(); }
};

/// specialization for types with method `static std::string info_name()`
template <typename T>
struct info<T, std::void_t<decltype(T::info_name())>> {
    static inline std::string name() { return T::info_name(); }
};

template <>
struct info<void,void> {
    static inline std::string name(){ return "void"; }
};

template <>
struct info<int,void> {
    static inline std::string name(){ return "int"; }
};

template <>
struct info<unsigned int,void> {
    static inline std::string name(){ return "unsigned int"; }
};

template <>
struct info<long int,void> {
    static inline std::string name(){ return "long int"; }
};

template <>
struct info<unsigned long int,void> {
    static inline std::string name(){ return "unsigned long int"; }
};

template <>
struct info<long long int,void> {
    static inline std::string name(){ return "long long int"; }
};

template <>
struct info<unsigned long long int,void> {
    static inline std::string name(){ return "unsigned long long int"; }
};

template <>
struct info<bool,void> {
    static inline std::string name(){ return "bool"; }
};

template <>
struct info<std::string,void> {
    static inline std::string name(){ return "std::string"; }
};

/// @return a name string for `T`
template <typename T>
inline std::string name() {
    return info<unqualified<T>>::name();
}

/**
 @brief append template tags and template types' names to a base name

 `sde::type::templatize<int>("sde::queue")` returns "sde::queue<int>".
 */
template <typename T, typename... Ts>
inline std::string templatize(const std::string& s) {
    std::stringstream ss;
    ss << s << "<" << name<T>();
    ((ss << "," << name<Ts>()), ...);
    ss << ">";
    return ss.str();
}

template <typename T>
struct info<std::shared_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::shared_ptr"); }
};

template <typename T>
struct info<std::weak_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::weak_ptr"); }
};

}

namespace chrono {

template <typename T>
struct is_duration : std::false_type { };

template <typename Rep, typename Period>
struct is_duration<std::chrono::duration<Rep,Period>> : std::true_type { };

/// convert a duration to a human readable count of its largest exact unit
template <typename Rep, typename Period>
inline std::string to_string(const std::chrono::duration<Rep, Period>& d) {
    if(d == std::chrono::duration<Rep, Period>::max()) { return "forever"; }

    std::stringstream ss;
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();

    if(ns % 1000000000 == 0 && ns) { ss << (ns / 1000000000) << "s"; }
    else if(ns % 1000000 == 0 && ns) { ss << (ns / 1000000) << "ms"; }
    else if(ns % 1000 == 0 && ns) { ss << (ns / 1000) << "us"; }
    else { ss << ns << "ns"; }

    return ss.str();
}

}

/*
 @brief interface for allowing an object instance to be printable

 Objects which implement printable can be passed to streams and converted to
 `std::string` representation.
 */
struct printable {
    virtual ~printable(){}

    /// @return the namespaced object name
    virtual std::string name() const = 0;

    /**
     @brief string with optional content of this object

     Overridden by inheritors to describe internal state, such as counters or
     other printable objects they contain.
     */
    virtual inline std::string content() const { return {}; }

    /// string conversion
    inline std::string to_string() const {
        std::stringstream ss;
        ss << this->name() << "@" << (void*)this;

        std::string c = this->content();

        if(!(c.empty())) {
            ss << "[" << c << "]";
        }

        return ss.str();
    }

    /// std::string conversion
    inline operator std::string() const { return to_string(); }
};

}

namespace std {

/// std:: printable string conversion
inline std::string to_string(const sde::printable& p) { return p.to_string(); }

}

/// :: ostream writing of a printable reference
inline std::ostream& operator<<(std::ostream& out, const sde::printable& p) {
    out << p.to_string();
    return out;
}

/// :: ostream writing of a printable pointer
inline std::ostream& operator<<(std::ostream& out, const sde::printable* p) {
    if(p) { out << *p; }
    else { out << "sde::printable@nullptr"; }
    return out;
}

namespace sde {
namespace config {
namespace logging {

/**
 @brief the process wide default log level

 Set by compiler define SDELOGLEVEL. Threads inherit this log level.
 */
int default_log_level();

}
}

/**
 @brief namespace object for underlying logging functions

 `logger` is rarely used directly, but through the macros above which
 determine at compile time if a logging statement is compiled.
 */
struct logger {
    /**
     @brief threads inherit the default_log_level()
     @return the current thread local log level
     */
    static int thread_log_level();

    /**
     @brief set the thread local log level

     Maximum value: 9
     Minimum value: -9
     */
    static void thread_log_level(int level);

    template <typename... As>
    static inline void constructor(const printable* p,
                                   int verbosity,
                                   const char* file,
                                   int line,
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::%s(%s)",
                        self.c_str(), name_str.c_str(), ingested.c_str());
        }
    }

    static inline void destructor(const printable* p,
                                  int verbosity,
                                  const char* file,
                                  int line) {
        if(verbosity <= logger::thread_log_level()) {
            std::string self(*p);
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::~%s()",
                        self.c_str(), name_str.c_str());
        }
    }

    template <typename... As>
    static inline void method_enter(const printable* p,
                                    int verbosity,
                                    const char* file,
                                    int line,
                                    std::string method_name,
                                    As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s(%s)",
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void method_body(const printable* p,
                                   int verbosity,
                                   const char* file,
                                   int line,
                                   std::string method_name,
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s():%s",
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_enter(int verbosity,
                                      const char* file,
                                      int line,
                                      std::string function_name,
                                      As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s(%s)",
                        function_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_body(int verbosity,
                                     const char* file,
                                     int line,
                                     std::string function_name,
                                     As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s():%s",
                        function_name.c_str(), ingested.c_str());
        }
    }

private:
    logger(){}

    // thread_local loglevel
    static int& tl_loglevel();

    // durations are printed with their unit
    template <typename A>
    static inline void ingest_item_(std::stringstream& ss, A&& a) {
        if constexpr (sde::chrono::is_duration<unqualified<A>>::value) {
            ss << sde::chrono::to_string(a);
        } else {
            ss << std::forward<A>(a);
        }
    }

    static inline void ingest_rest_of_args_(std::stringstream& ss) { }

    // in argument lists, begin inserting "," between arguments
    template <typename A, typename... As>
    static inline void ingest_rest_of_args_(std::stringstream& ss, A&& a, As&&... as) {
        ss << ", ";
        ingest_item_(ss,std::forward<A>(a));
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }

    static inline void ingest_parameters_(std::stringstream& ss) { }

    // for ingesting a list of function or method arguments
    template <typename A, typename... As>
    static inline void ingest_parameters_(std::stringstream& ss, A&& a, As&&... as) {
        ingest_item_(ss,std::forward<A>(a));
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }

    static inline void ingest_(std::stringstream& ss) { }

    // for ingesting arbitrary data into a logline
    template <typename A, typename... As>
    static inline void ingest_(std::stringstream& ss, A&& a, As&&... as) {
        ingest_item_(ss,std::forward<A>(a));
        ingest_(ss, std::forward<As>(as)...);
    }
};

}

#endif
