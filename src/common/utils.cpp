#include "common/utils.hpp"
#include <stdlib.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

chrono::steady_clock::duration seconds_to_duration(double seconds) {
    return chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(seconds));
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace grader
