#include <cassert>
#include <iostream>
#include <string>

#include "golden/collaborators.h"
#include "golden/errors.h"
#include "golden/io.h"
#include "test_util.h"

using namespace golden;

static Slot blog_slot() {
    Slot s;
    s.archetype = "blog";
    s.complexity = "MVP";
    s.locale = "en";
    s.rep = 1;
    s.seq = 1;
    s.slot_id = make_slot_id(StratumKey{"blog", "MVP", "en"}, "replit", 1, 1);
    s.target_band = Band::Short;
    s.pages = {"Feed", "Post"};
    s.features = {"Comments"};
    return s;
}

int main() {
    assert(shell_quote("a b") == "'a b'");
    assert(shell_quote("it's") == "'it'\\''s'");

    const auto sj = slot_to_json(blog_slot());
    assert(sj["slot_id"] == "golden_blogMVPen_replit_rep01_seq001");
    assert(sj["length_band"] == "SHORT");
    assert(sj["platform"]["bind"].is_null());
    assert((sj["pages"] == nlohmann::json::array({"Feed", "Post"})));
    assert((sj["features"] == nlohmann::json::array({"Comments"})));

    const auto dir = mk_tmp_dir("synth");

    // one candidate per variant, id carries seed and index
    {
        Item proto = make_item("gen_{seed}_IDX", "blog", Band::Short, "short text body");
        proto.slot_id = blog_slot().slot_id;
        const std::string line = item_to_json(proto).dump();
        const size_t at = line.find("IDX");
        const std::string cmd = "for i in $(seq 1 {variants}); do printf '%s\\n' " + shell_quote(line.substr(0, at)) +
                                "\"$i\"" + shell_quote(line.substr(at + 3)) + "; done > {out_jsonl}";

        CommandSynthesizer synth(cmd, dir);
        const auto items = synth.synthesize(blog_slot(), 3, 42);
        assert(items.size() == 3);
        assert(items[0].candidate_id == "gen_42_1");
        assert(items[2].candidate_id == "gen_42_3");
        assert(items[0].slot_id == "golden_blogMVPen_replit_rep01_seq001");
        assert(items[0].length_band == Band::Short);
    }

    // slot file is readable by the command
    {
        CommandSynthesizer synth("grep -q blogMVPen {slot_json} && grep -q Feed {slot_json} && "
                                 "grep -q Comments {slot_json} && : > {out_jsonl}", dir);
        assert(synth.synthesize(blog_slot(), 1, 1).empty());
    }

    bool failed = false;
    try {
        CommandSynthesizer synth("exit 7", dir);
        synth.synthesize(blog_slot(), 1, 1);
    } catch (const GoldenException& e) {
        failed = e.code() == ErrorCode::SynthesisFailed;
    }
    assert(failed);

    failed = false;
    try {
        CommandSynthesizer synth("echo 'not json' > {out_jsonl}", dir);
        synth.synthesize(blog_slot(), 1, 1);
    } catch (const GoldenException& e) {
        failed = e.code() == ErrorCode::SynthesisFailed;
    }
    assert(failed);

    bool empty_cmd = false;
    try {
        CommandSynthesizer synth("", dir);
    } catch (const GoldenException& e) {
        empty_cmd = e.code() == ErrorCode::InvalidArgs;
    }
    assert(empty_cmd);

    std::cout << "OK\n";
    return 0;
}
