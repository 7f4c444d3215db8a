#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/FrontmatterCodec.hpp"

using dnagraph::infrastructure::FrontmatterCodec;

int main() {
    std::cout << "[Test] Starting FrontmatterCodec Test..." << std::endl;

    // Block lists, flow mappings, nested mappings
    {
        const std::string text =
            "---\n"
            "id: DEC-007\n"
            "title: \"Ports: keep \\\"adapters\\\" thin\"\n"
            "date: 2026-03-01\n"
            "level: 3\n"
            "state: suggested\n"
            "stakes: high\n"
            "depends_on:\n"
            "  - DEC-001\n"
            "  - {id: DEC-002, note: scoped, narrowly}\n"
            "  - id: DEC-003\n"
            "    note: structured\n"
            "---\n"
            "\n"
            "## Decision\n"
            "Body text.\n";

        auto doc = FrontmatterCodec::Parse(text);
        assert(doc && "Document with frontmatter should parse.");
        const auto& f = doc->fields;
        assert(f["id"] == "DEC-007");
        assert(f["title"] == "Ports: keep \"adapters\" thin");
        assert(f["date"] == "2026-03-01");
        assert(f["level"] == 3);
        assert(f["stakes"] == "high");
        assert(f["depends_on"].size() == 3);
        assert(f["depends_on"][0] == "DEC-001");
        assert(f["depends_on"][1]["id"] == "DEC-002");
        assert(f["depends_on"][1]["note"] == "scoped, narrowly");
        assert(f["depends_on"][2]["id"] == "DEC-003");
        assert(f["depends_on"][2]["note"] == "structured");
        assert(doc->body == "\n## Decision\nBody text.\n");

        // Serialize then parse again keeps fields and body
        std::string written = FrontmatterCodec::Serialize(doc->fields, doc->body);
        auto again = FrontmatterCodec::Parse(written);
        assert(again);
        assert(again->body == doc->body);
        assert(again->fields["title"] == f["title"]);
        assert(again->fields["depends_on"][1]["id"] == "DEC-002");
        assert(FrontmatterCodec::Serialize(again->fields, again->body) == written);
    }

    // Flow mapping notes keep "key: value" text and survive a rewrite
    {
        auto doc = FrontmatterCodec::Parse(
            "---\nid: DEC-008\nlevel: 2\ndepends_on:\n  - {id: DEC-001, note: see DEC-004, state: pending}\n---\n");
        assert(doc);
        const auto& dep = doc->fields["depends_on"][0];
        assert(dep["id"] == "DEC-001");
        assert(dep["note"] == "see DEC-004, state: pending");
        assert(!dep.contains("state"));

        auto again = FrontmatterCodec::Parse(FrontmatterCodec::Serialize(doc->fields, doc->body));
        assert(again && again->fields["depends_on"][0] == dep);
    }

    // CRLF line endings
    {
        auto doc = FrontmatterCodec::Parse("---\r\nid: DEC-009\r\nlevel: 2\r\ndepends_on:\r\n  - DEC-001\r\n---\r\nx\r\n");
        assert(doc);
        assert(doc->fields["id"] == "DEC-009");
        assert(doc->fields["level"] == 2);
        assert(doc->fields["depends_on"].size() == 1 && doc->fields["depends_on"][0] == "DEC-001");
    }

    // Inline lists and the fixed field order
    {
        auto doc = FrontmatterCodec::Parse("---\nstate: committed\nid: DEC-001\nlevel: 1\ndepends_on: []\n---\nx\n");
        assert(doc);
        assert(doc->fields["depends_on"].is_array() && doc->fields["depends_on"].empty());
        std::string written = FrontmatterCodec::Serialize(doc->fields, doc->body);
        assert(written.rfind("---\nid: DEC-001\ntitle: \ndate: \nlevel: 1\nstate: committed\ndepends_on: []\n---\n", 0) == 0);

        auto inline_ = FrontmatterCodec::Parse("---\nid: DEC-002\ndepends_on: [DEC-001, DEC-003]\n---\n");
        assert(inline_ && inline_->fields["depends_on"].size() == 2);
        assert(inline_->body.empty());
    }

    // Scalar coercion
    {
        assert(FrontmatterCodec::Coerce("42") == 42);
        assert(FrontmatterCodec::Coerce("-3") == -3);
        assert(FrontmatterCodec::Coerce("2.5") == 2.5);
        assert(FrontmatterCodec::Coerce("TRUE") == true);
        assert(FrontmatterCodec::Coerce("false") == false);
        assert(FrontmatterCodec::Coerce("~").is_null());
        assert(FrontmatterCodec::Coerce("null").is_null());
        assert(FrontmatterCodec::Coerce("'quoted'") == "quoted");
        assert(FrontmatterCodec::Coerce("plain words") == "plain words");
    }

    // Title quoting
    {
        assert(FrontmatterCodec::TitleNeedsQuoting("a: b"));
        assert(FrontmatterCodec::TitleNeedsQuoting("#hash"));
        assert(FrontmatterCodec::TitleNeedsQuoting("*starred"));
        assert(!FrontmatterCodec::TitleNeedsQuoting("Plain title"));
    }

    // Documents without a closed block are rejected
    {
        assert(!FrontmatterCodec::Parse("# Just markdown\n"));
        assert(!FrontmatterCodec::Parse("---\nid: DEC-001\nno closing\n"));
    }

    std::cout << "[PASS] FrontmatterCodec Test Successful!" << std::endl;
    return 0;
}
