#include "rfnav/emitter.hpp"
#include "test_common.hpp"

#include <cstdlib>
#include <set>
#include <utility>

using namespace rfnav;

static const EmitterStatus k_all[] = {
    EmitterStatus::Unknown, EmitterStatus::New, EmitterStatus::Changed,
    EmitterStatus::Cached, EmitterStatus::Blacklisted
};

using S = EmitterStatus;

static const std::set<std::pair<S, S>> k_legal = {
    {S::Unknown, S::New}, {S::Unknown, S::Cached}, {S::Unknown, S::Blacklisted},
    {S::New, S::Cached}, {S::New, S::Blacklisted},
    {S::Cached, S::Changed}, {S::Cached, S::Blacklisted},
    {S::Changed, S::Cached}, {S::Changed, S::Blacklisted},
};

static void test_table() {
    test::section("transition table is total and matches the legal set");
    for (S from : k_all) {
        for (S to : k_all) {
            S got = next_status(from, to);
            if (from == to || k_legal.count({from, to})) {
                test::check(got == to, __LINE__);
            } else {
                test::check(got == from, __LINE__);
            }
        }
    }
}

static void test_blacklisted_terminal() {
    test::section("blacklisted is terminal");
    for (S to : k_all) test::check(next_status(S::Blacklisted, to) == S::Blacklisted, __LINE__);
}

static void test_random_walks() {
    test::section("random request sequences only take legal steps");
    std::srand(11);
    for (int walk = 0; walk < 200; ++walk) {
        S s = S::Unknown;
        for (int i = 0; i < 50; ++i) {
            S req = k_all[std::rand() % 5];
            S next = next_status(s, req);
            test::check(next == s || k_legal.count({s, next}), __LINE__);
            s = next;
        }
    }
}

static void test_names() {
    test::section("status names");
    test::check(std::string(to_string(S::Blacklisted)) == "blacklisted", __LINE__);
    test::check(std::string(to_string(SyncAction::Invalidate)) == "invalidate", __LINE__);
}

int main() {
    std::cout << "Emitter status test" << std::endl;
    test_table();
    test_blacklisted_terminal();
    test_random_walks();
    test_names();
    return test::finish("emitter_status_test");
}
