#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/EditEngine.hpp"
#include "TestSupport.hpp"

using namespace reflect::domain;
using reflect::test::SAMPLE_AGENTS_MD;

namespace {

ProposedEdit Replace(const std::string& anchor, const std::string& newText) {
    ProposedEdit e;
    e.kind = EditKind::Replace;
    e.anchorText = anchor;
    e.newText = newText;
    return e;
}

ProposedEdit Insert(const std::string& after, const std::string& newText) {
    ProposedEdit e;
    e.kind = EditKind::Insert;
    e.insertAfterText = after;
    e.newText = newText;
    return e;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

const std::string kPrefix50 = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMN";

void TestInsertExample() {
    auto outcome = EditEngine::apply("- Rule A.\n- Rule B.", {Insert("- Rule A.", "- Rule A-prime.")});
    assert(outcome.appliedCount == 1);
    assert(outcome.rejections.empty());
    assert(outcome.finalText == "- Rule A.\n- Rule A-prime.\n- Rule B.");
}

void TestReplaceExact() {
    const std::string anchor = "- **Be concise.** Answer the question that was asked, then stop.";
    const std::string replacement = anchor + " Do NOT recap what you just did.";
    auto outcome = EditEngine::apply(SAMPLE_AGENTS_MD, {Replace(anchor, replacement)});
    assert(outcome.appliedCount == 1);
    assert(Contains(outcome.finalText, replacement));
    assert(outcome.finalText.size() == SAMPLE_AGENTS_MD.size() + replacement.size() - anchor.size());

    auto whole = EditEngine::apply(SAMPLE_AGENTS_MD, {Replace("- **Prefer ripgrep** over grep for searching the tree.",
                                                              "- **Prefer ripgrep** (rg) for all searches.")});
    assert(whole.appliedCount == 1);
    assert(!Contains(whole.finalText, "over grep for searching"));
    assert(Contains(whole.finalText, "(rg) for all searches."));
}

void TestMissingAnchor() {
    auto outcome = EditEngine::apply(SAMPLE_AGENTS_MD, {
        Replace("- **Never push to main.**", "- **Never push to main without review.**"),
        Insert("## Deployment", "- Tag releases.")
    });
    assert(outcome.appliedCount == 0);
    assert(outcome.finalText == SAMPLE_AGENTS_MD);
    assert(outcome.rejections.size() == 2);
    assert(outcome.rejections[0].kind == RejectionKind::MissingAnchor);
    assert(StartsWith(outcome.rejections[0].message, "Could not find text to strengthen: \"- **Never push to main.**...\""));
    assert(StartsWith(outcome.rejections[1].message, "Could not find insertion point: \"## Deployment...\""));

    // Case matters.
    auto cased = EditEngine::apply(SAMPLE_AGENTS_MD, {Insert("## communication", "- Be kind.")});
    assert(cased.appliedCount == 0);
    assert(cased.rejections[0].kind == RejectionKind::MissingAnchor);
}

void TestAmbiguity() {
    const std::string doc = "alpha\nbeta\nalpha\n";
    auto outcome = EditEngine::apply(doc, {Replace("alpha", "gamma"), Insert("alpha", "- new")});
    assert(outcome.appliedCount == 0);
    assert(outcome.finalText == doc);
    assert(outcome.rejections.size() == 2);
    assert(outcome.rejections[0].kind == RejectionKind::Ambiguous);
    assert(StartsWith(outcome.rejections[0].message, "Ambiguous match (appears multiple times): "));
    assert(StartsWith(outcome.rejections[1].message, "Ambiguous insertion point (appears multiple times): "));

    // Overlapping repeats are ambiguous too.
    auto overlap = EditEngine::apply("xaaax", {Replace("aa", "b")});
    assert(overlap.appliedCount == 0);
    assert(overlap.rejections[0].kind == RejectionKind::Ambiguous);
}

void TestInsertIdempotence() {
    const ProposedEdit edit = Insert("- **Run the tests** before declaring a change done.",
                                     "- **Read the error output** before retrying a failing command.");
    auto first = EditEngine::apply(SAMPLE_AGENTS_MD, {edit});
    assert(first.appliedCount == 1);

    auto second = EditEngine::apply(first.finalText, {edit});
    assert(second.appliedCount == 0);
    assert(second.finalText == first.finalText);
    assert(second.rejections.size() == 1);
    assert(second.rejections[0].kind == RejectionKind::AlreadyExists);
    assert(StartsWith(second.rejections[0].message, "Text already exists in file: \"- **Read the error output**"));

    // Surrounding whitespace does not defeat the check.
    auto padded = EditEngine::apply(first.finalText, {Insert("- **Prefer ripgrep** over grep for searching the tree.",
                                                             "\n  - **Read the error output** before retrying a failing command.  \n")});
    assert(padded.appliedCount == 0);
    assert(padded.rejections[0].kind == RejectionKind::AlreadyExists);
}

void TestSequentialVisibility() {
    const std::string doc = "- Rule A.\n- Rule B.";
    const ProposedEdit addC = Insert("- Rule B.", "- Rule C.");
    const ProposedEdit addD = Insert("- Rule C.", "- Rule D.");

    auto inOrder = EditEngine::apply(doc, {addC, addD});
    assert(inOrder.appliedCount == 2);
    assert(inOrder.finalText == "- Rule A.\n- Rule B.\n- Rule C.\n- Rule D.");

    auto reversed = EditEngine::apply(doc, {addD, addC});
    assert(reversed.appliedCount == 1);
    assert(reversed.rejections.size() == 1);
    assert(reversed.rejections[0].kind == RejectionKind::MissingAnchor);
    assert(reversed.finalText == "- Rule A.\n- Rule B.\n- Rule C.");
}

void TestDuplicationGuardBoundary() {
    assert(kPrefix50.size() == 50);
    const std::string echoed = kPrefix50 + " and again " + kPrefix50;

    const std::string anchor51 = kPrefix50 + "!";
    auto rejected = EditEngine::apply("# Doc\n" + anchor51 + "\nend\n", {Replace(anchor51, echoed)});
    assert(rejected.appliedCount == 0);
    assert(rejected.rejections.size() == 1);
    assert(rejected.rejections[0].kind == RejectionKind::Duplication);
    assert(StartsWith(rejected.rejections[0].message, "Duplication detected in replacement text: "));

    auto accepted = EditEngine::apply("# Doc\n" + kPrefix50 + "\nend\n", {Replace(kPrefix50, echoed)});
    assert(accepted.appliedCount == 1);
    assert(accepted.finalText == "# Doc\n" + echoed + "\nend\n");

    // A single echo of the anchor's opening is a normal extension.
    auto extended = EditEngine::apply("# Doc\n" + anchor51 + "\nend\n", {Replace(anchor51, anchor51 + " Always.")});
    assert(extended.appliedCount == 1);
}

void TestDuplicationGuardIsByteWise() {
    // 26 two-byte characters: 52 bytes, so the guard applies although there are only 26 characters.
    std::string anchor;
    for (int i = 0; i < 26; ++i) anchor += "\xC3\xA9";
    auto outcome = EditEngine::apply("# Doc\n" + anchor + "\nend\n", {Replace(anchor, anchor + anchor)});
    assert(outcome.appliedCount == 0);
    assert(outcome.rejections[0].kind == RejectionKind::Duplication);

    auto accented = EditEngine::apply("- Caf\xC3\xA9 rule.\n- Other rule.", {Insert("- Caf\xC3\xA9 rule.", "- Tea rule.")});
    assert(accented.appliedCount == 1);
    assert(accented.finalText == "- Caf\xC3\xA9 rule.\n- Tea rule.\n- Other rule.");
}

void TestInvalidShapes() {
    ProposedEdit unknown;
    unknown.newText = "- Something.";
    ProposedEdit replaceNoAnchor = Replace("", "- x");
    replaceNoAnchor.anchorText.reset();
    ProposedEdit insertNoText = Insert("- Rule A.", "");
    ProposedEdit replaceWithAfterOnly;
    replaceWithAfterOnly.kind = EditKind::Replace;
    replaceWithAfterOnly.insertAfterText = "- Rule A.";
    replaceWithAfterOnly.newText = "- Rule Z.";

    auto outcome = EditEngine::apply("- Rule A.\n- Rule B.", {unknown, replaceNoAnchor, insertNoText, replaceWithAfterOnly});
    assert(outcome.appliedCount == 0);
    assert(outcome.rejections.size() == 4);
    for (const auto& r : outcome.rejections) {
        assert(r.kind == RejectionKind::Invalid);
        assert(StartsWith(r.message, "Invalid edit: "));
        assert(r.message.size() <= std::string("Invalid edit: ").size() + 100);
    }
}

void TestSnippetLength() {
    std::string longAnchor(200, 'q');
    auto outcome = EditEngine::apply(SAMPLE_AGENTS_MD, {Replace(longAnchor, "- x")});
    const std::string& msg = outcome.rejections[0].message;
    assert(msg == "Could not find text to strengthen: \"" + std::string(80, 'q') + "...\"");
}

void TestPartialSuccess() {
    auto outcome = EditEngine::apply(SAMPLE_AGENTS_MD, {
        Insert("## Tools", "- **Use the project's formatter** before committing."),
        Replace("- nothing like this", "- x"),
        Replace("- **Keep diffs minimal.** Touch only the lines the task needs.",
                "- **Keep diffs minimal.** Touch only the lines the task needs. No drive-by refactors.")
    });
    assert(outcome.appliedCount == 2);
    assert(outcome.rejections.size() == 1);
    assert(outcome.rejectionMessages().size() == 1);
    assert(Contains(outcome.finalText, "## Tools\n- **Use the project's formatter** before committing.\n- **Prefer ripgrep**"));
    assert(Contains(outcome.finalText, "No drive-by refactors."));
}

void TestCountOccurrences() {
    assert(EditEngine::countOccurrences("aaaa", "aa") == 2);
    assert(EditEngine::countOccurrences("abcabc", "abc") == 2);
    assert(EditEngine::countOccurrences("abc", "") == 0);
    assert(EditEngine::countOccurrences("", "a") == 0);
}

} // namespace

int main() {
    std::cout << "[Test] Starting EditEngine Test..." << std::endl;

    TestInsertExample();
    TestReplaceExact();
    TestMissingAnchor();
    TestAmbiguity();
    TestInsertIdempotence();
    TestSequentialVisibility();
    TestDuplicationGuardBoundary();
    TestDuplicationGuardIsByteWise();
    TestInvalidShapes();
    TestSnippetLength();
    TestPartialSuccess();
    TestCountOccurrences();

    std::cout << "[PASS] EditEngine Test." << std::endl;
    return 0;
}
