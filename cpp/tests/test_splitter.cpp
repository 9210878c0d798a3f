#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "golden/errors.h"
#include "golden/splitter.h"
#include "test_util.h"

using namespace golden;

static std::vector<Item> two_strata() {
    const Band bands[5] = {Band::Short, Band::Standard, Band::Standard, Band::Standard, Band::Extended};
    std::vector<Item> items;
    int seq = 1;
    for (const char* a : {"blog", "notes"}) {
        for (int rep = 1; rep <= 5; ++rep) {
            Item it = make_item(std::string(a) + std::to_string(rep), a, bands[rep - 1], "");
            it.rep = rep;
            it.seq = seq;
            it.slot_id = make_slot_id(it.stratum(), "replit", rep, seq);
            items.push_back(it);
            ++seq;
        }
    }
    return items;
}

int main() {
    const auto items = two_strata();

    SplitCaps caps;
    caps.train = 6;
    caps.val = 2;
    caps.test = 2;
    const SplitAssignment a = split_stratified(items, caps);

    assert(a.train().size() == 6);
    assert(a.val().size() == 2);
    assert(a.test().size() == 2);

    std::set<std::string> all;
    for (const auto& s : a.splits) all.insert(s.begin(), s.end());
    assert(all.size() == items.size());

    // SHORT items are spread first
    const std::string short_a = items[0].slot_id;
    const std::string short_b = items[5].slot_id;
    assert(a.train()[0] == short_a);
    assert(a.val()[0] == short_b);

    // pure function of ids + caps; seed has no effect
    const SplitAssignment b = split_stratified(items, caps, 12345);
    assert(b.splits == a.splits);
    assert(b.digest == a.digest);
    assert(a.digest.size() == 64);
    assert(a.digest == split_digest(a.splits_json()));

    std::vector<Item> shuffled(items.rbegin(), items.rend());
    assert(split_stratified(shuffled, caps).digest == a.digest);

    // overflow goes to train
    SplitCaps small;
    small.train = 1;
    small.val = 1;
    small.test = 1;
    const SplitAssignment o = split_stratified(items, small);
    assert(o.train().size() == 8 && o.val().size() == 1 && o.test().size() == 1);

    auto j = to_json(a);
    assert(j["counts"]["train"] == 6);
    assert(j["digest"] == a.digest);
    assert(j["splits"]["val"].size() == 2);

    bool threw = false;
    try {
        std::vector<Item> dup = {items[0], items[0]};
        split_stratified(dup, caps);
    } catch (const GoldenException& e) {
        threw = e.code() == ErrorCode::InvalidArgs;
    }
    assert(threw);

    std::cout << "OK\n";
    return 0;
}
