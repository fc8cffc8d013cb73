#include <algorithm>

#include <gtest/gtest.h>

#include "common/assert.hpp"

#include "surf/diagnostic.hpp"
#include "surf/parsing/parse.hpp"
#include "surf/validate.hpp"

namespace surfdoc {
namespace {

std::vector<Diagnostic> diagnose(std::string_view source)
{
    return parse(source).diagnostics;
}

Size count_of(const std::vector<Diagnostic>& diagnostics, Diagnostic_Code code)
{
    return Size(std::ranges::count(diagnostics, code, &Diagnostic::code));
}

/// @brief Returns the first diagnostic with the given code.
const Diagnostic& first_of(const std::vector<Diagnostic>& diagnostics, Diagnostic_Code code)
{
    const auto it = std::ranges::find(diagnostics, code, &Diagnostic::code);
    SURFDOC_ASSERT(it != diagnostics.end());
    return *it;
}

TEST(Surf_Diagnostic, ids_and_names)
{
    EXPECT_EQ(diagnostic_id(Diagnostic_Code::unterminated_directive), "SD001");
    EXPECT_EQ(diagnostic_id(Diagnostic_Code::required_attribute_missing), "SD004");
    EXPECT_EQ(diagnostic_id(Diagnostic_Code::page_order_ambiguous), "SD019");
    EXPECT_EQ(diagnostic_id(Diagnostic_Code::front_matter_value_invalid), "SD021");
    EXPECT_EQ(diagnostic_code_name(Diagnostic_Code::alt_text_missing), "alt_text_missing");
    EXPECT_EQ(diagnostic_code_by_name("SD012"), Diagnostic_Code::metric_unit_unknown);
    EXPECT_EQ(diagnostic_code_by_name("duplicate_id"), Diagnostic_Code::duplicate_id);
    EXPECT_EQ(diagnostic_code_by_name("SD000"), std::nullopt);
    EXPECT_EQ(diagnostic_code_by_name("sd001"), std::nullopt);
}

TEST(Surf_Diagnostic, severities)
{
    EXPECT_EQ(severity_of(Diagnostic_Code::metric_unit_unknown), Severity::warning);
    EXPECT_EQ(severity_of(Diagnostic_Code::code_language_missing), Severity::warning);
    EXPECT_EQ(severity_of(Diagnostic_Code::alt_text_missing), Severity::warning);
    EXPECT_EQ(severity_of(Diagnostic_Code::page_order_ambiguous), Severity::warning);
    EXPECT_EQ(severity_of(Diagnostic_Code::orphan_page), Severity::error);
    EXPECT_EQ(severity_of(Diagnostic_Code::duplicate_id), Severity::error);
    EXPECT_EQ(severity_of(Diagnostic_Code::front_matter_field_missing), Severity::warning);
    EXPECT_EQ(severity_of(Diagnostic_Code::front_matter_value_invalid), Severity::error);
}

TEST(Surf_Diagnostic, has_errors)
{
    EXPECT_FALSE(has_errors(diagnose("::code\nx\n::\n")));
    EXPECT_TRUE(has_errors(diagnose("::callout\nx\n::\n")));
}

TEST(Surf_Diagnostic, sorted_by_position_then_code)
{
    std::vector<Diagnostic> diagnostics {
        { .code = Diagnostic_Code::duplicate_id, .message = "b", .pos = { { 1, 0, 20 }, 1 } },
        { .code = Diagnostic_Code::alt_text_missing, .message = "c", .pos = { { 0, 5, 5 }, 1 } },
        { .code = Diagnostic_Code::malformed_attribute, .message = "a", .pos = { { 0, 5, 5 }, 1 } },
    };
    sort_diagnostics(diagnostics);
    EXPECT_EQ(diagnostics[0].message, "a");
    EXPECT_EQ(diagnostics[1].message, "c");
    EXPECT_EQ(diagnostics[2].message, "b");
}

TEST(Surf_Validate, clean_document)
{
    EXPECT_TRUE(diagnose("# Hello\n\n::callout[type=info]\nHi\n::\n").empty());
}

TEST(Surf_Validate, includes_parse_diagnostics)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::callout[type=info title=\"x]\nA\n::\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::malformed_attribute), 2);
}

TEST(Surf_Validate, unterminated_directive)
{
    const std::vector<Diagnostic> diagnostics = diagnose("a\n\n::summary\nnever closed\n");
    EXPECT_EQ(first_of(diagnostics, Diagnostic_Code::unterminated_directive).pos.line, 2);
}

TEST(Surf_Validate, required_attribute_missing)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::cta[label=Go]\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::required_attribute_missing);
    EXPECT_NE(diagnostics[0].message.find("'href'"), std::string::npos);
    EXPECT_EQ(diagnostics[0].pos.column, 0);
    EXPECT_EQ(diagnostics[0].pos.length, 15);
}

TEST(Surf_Validate, callout_type_is_required)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::callout\nx\n::\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::required_attribute_missing), 1);
}

TEST(Surf_Validate, attribute_type_mismatch)
{
    const std::vector<Diagnostic> diagnostics
        = diagnose("::site\n:::page[order=first]\nx\n:::\n::\n\n::data[sortable=\"yes\"]\n::\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::attribute_type_mismatch), 2);
    EXPECT_EQ(first_of(diagnostics, Diagnostic_Code::attribute_type_mismatch).pos.line, 1);
}

TEST(Surf_Validate, list_for_scalar_is_mismatch)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::figure[src=[\"a\"] alt=x]\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::attribute_type_mismatch), 1);
}

TEST(Surf_Validate, metric_values)
{
    EXPECT_TRUE(diagnose("::metric[label=A value=\"$1,200\"]\n").empty());
    EXPECT_TRUE(diagnose("::metric[label=A value=\"99.9%\"]\n").empty());
    EXPECT_TRUE(diagnose("::metric[label=A value=-3]\n").empty());
    EXPECT_EQ(count_of(diagnose("::metric[label=A value=lots]\n"),
                       Diagnostic_Code::attribute_type_mismatch),
              1);
}

TEST(Surf_Validate, enum_value_invalid)
{
    const std::vector<Diagnostic> diagnostics
        = diagnose("::decision[status=maybe]\nWhy\n::\n\n::metric[label=a value=1 trend=sideways]\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::enum_value_invalid), 2);
    EXPECT_EQ(first_of(diagnostics, Diagnostic_Code::enum_value_invalid).pos.column, 11);
}

TEST(Surf_Validate, enum_names_are_case_sensitive)
{
    EXPECT_EQ(count_of(diagnose("::callout[type=Warning]\nx\n::\n"),
                       Diagnostic_Code::enum_value_invalid),
              1);
}

TEST(Surf_Validate, orphan_page)
{
    const std::vector<Diagnostic> top_level = diagnose("::page[title=A]\nx\n::\n");
    ASSERT_EQ(count_of(top_level, Diagnostic_Code::orphan_page), 1);
    EXPECT_FALSE(first_of(top_level, Diagnostic_Code::orphan_page).related);

    const std::vector<Diagnostic> in_tabs = diagnose("::tabs\n:::page\nx\n:::\n::\n");
    const Diagnostic& orphan = first_of(in_tabs, Diagnostic_Code::orphan_page);
    EXPECT_EQ(orphan.pos.line, 1);
    ASSERT_TRUE(orphan.related);
    EXPECT_EQ(orphan.related->line, 0);
}

TEST(Surf_Validate, nested_site_page_is_not_orphan)
{
    const std::vector<Diagnostic> diagnostics
        = diagnose("::site\n:::page[route=/a]\nA\n:::\n::\n");
    EXPECT_TRUE(diagnostics.empty());
}

TEST(Surf_Validate, site_without_pages)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::site\nname: X\n::\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::site_without_pages);
}

TEST(Surf_Validate, empty_container)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::tabs\n::\n\n::columns\n\n::\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::empty_container), 2);
}

TEST(Surf_Validate, faq_entry_incomplete)
{
    EXPECT_EQ(count_of(diagnose("::faq\nJust text.\n::\n"), Diagnostic_Code::faq_entry_incomplete),
              1);
    const std::vector<Diagnostic> diagnostics = diagnose("::faq\n## A?\nYes.\n## B?\n::\n");
    ASSERT_EQ(count_of(diagnostics, Diagnostic_Code::faq_entry_incomplete), 1);
    EXPECT_EQ(first_of(diagnostics, Diagnostic_Code::faq_entry_incomplete).pos.line, 3);
}

TEST(Surf_Validate, pricing_tiers_inconsistent)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::pricing-table\n"
                                                         "| | Free | Pro |\n"
                                                         "|---|---|---|\n"
                                                         "| A | 1 | 2 |\n"
                                                         "| B | 1 |\n"
                                                         "| C | 1 | 2 | 3 |\n"
                                                         "::\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::pricing_tiers_inconsistent), 2);
    EXPECT_EQ(first_of(diagnostics, Diagnostic_Code::pricing_tiers_inconsistent).pos.line, 4);
}

TEST(Surf_Validate, metric_unit_unknown)
{
    EXPECT_TRUE(diagnose("::metric[label=a value=1 unit=ms]\n").empty());
    const std::vector<Diagnostic> diagnostics = diagnose("::metric[label=a value=1 unit=MS]\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::metric_unit_unknown);
    EXPECT_EQ(diagnostics[0].severity(), Severity::warning);
}

TEST(Surf_Validate, decision_outcome_missing)
{
    EXPECT_EQ(count_of(diagnose("::decision\n::\n"), Diagnostic_Code::decision_outcome_missing), 1);
    EXPECT_TRUE(diagnose("::decision\nWe keep the status quo.\n::\n").empty());
    EXPECT_EQ(count_of(diagnose("::decision[options=[\"a\", \"b\"]]\nx\n::\n"),
                       Diagnostic_Code::decision_outcome_missing),
              1);
    EXPECT_EQ(count_of(diagnose("::decision[options=[\"a\", \"b\"] outcome=c]\nx\n::\n"),
                       Diagnostic_Code::decision_outcome_missing),
              1);
    EXPECT_TRUE(diagnose("::decision[options=\"a, b\" outcome=b]\nx\n::\n").empty());
}

TEST(Surf_Validate, code_language_missing)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::code\nx\n::\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::code_language_missing);
}

TEST(Surf_Validate, alt_text_missing)
{
    const std::vector<Diagnostic> diagnostics
        = diagnose("::figure[src=a.png]\n::hero-image[src=b.png]\n");
    EXPECT_EQ(count_of(diagnostics, Diagnostic_Code::alt_text_missing), 2);
}

TEST(Surf_Validate, testimonial_author_missing)
{
    EXPECT_EQ(count_of(diagnose("::testimonial\nGreat.\n::\n"),
                       Diagnostic_Code::testimonial_author_missing),
              1);
    EXPECT_TRUE(diagnose("::testimonial[name=Jo]\nGreat.\n::\n").empty());
}

TEST(Surf_Validate, nesting_depth_limit)
{
    const std::string_view six_levels = "::tabs\n"
                                        ":::tabs\n"
                                        "::::tabs\n"
                                        ":::::tabs\n"
                                        "::::::tabs\n"
                                        ":::::::tabs\n"
                                        "Deep.\n"
                                        ":::::::\n"
                                        "::::::\n"
                                        ":::::\n"
                                        "::::\n"
                                        ":::\n"
                                        "::\n";
    EXPECT_TRUE(diagnose(six_levels).empty());

    const std::string_view seven_levels = "::columns\n"
                                          ":::columns\n"
                                          "::::columns\n"
                                          ":::::columns\n"
                                          "::::::columns\n"
                                          ":::::::columns\n"
                                          "::::::::columns\n"
                                          "Deep.\n"
                                          "::::::::\n"
                                          ":::::::\n"
                                          "::::::\n"
                                          ":::::\n"
                                          "::::\n"
                                          ":::\n"
                                          "::\n";
    const std::vector<Diagnostic> diagnostics = diagnose(seven_levels);
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::nesting_too_deep);
    EXPECT_EQ(diagnostics[0].pos.line, 6);
}

TEST(Surf_Validate, duplicate_id)
{
    const std::vector<Diagnostic> diagnostics
        = diagnose("::data[id=t]\n::\n\n::site\n:::page[id=t route=/]\nx\n:::\n::\n");
    ASSERT_EQ(count_of(diagnostics, Diagnostic_Code::duplicate_id), 1);
    const Diagnostic& duplicate = first_of(diagnostics, Diagnostic_Code::duplicate_id);
    EXPECT_EQ(duplicate.pos.line, 4);
    ASSERT_TRUE(duplicate.related);
    EXPECT_EQ(duplicate.related->line, 0);
}

TEST(Surf_Validate, duplicate_route)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::site\n"
                                                         ":::page[route=/a]\nA\n:::\n"
                                                         ":::page[route=\"a/\"]\nB\n:::\n"
                                                         ":::page[route=/b]\nC\n:::\n"
                                                         "::\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::duplicate_id);
    EXPECT_EQ(diagnostics[0].pos.line, 4);
    ASSERT_TRUE(diagnostics[0].related);
    EXPECT_EQ(diagnostics[0].related->line, 1);
}

TEST(Surf_Validate, page_order_duplicate)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::site\n"
                                                         ":::page[route=/a order=1]\nA\n:::\n"
                                                         ":::page[route=/b order=1]\nB\n:::\n"
                                                         "::\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::page_order_ambiguous);
    EXPECT_EQ(diagnostics[0].pos.line, 4);
    ASSERT_TRUE(diagnostics[0].related);
    EXPECT_EQ(diagnostics[0].related->line, 1);
}

TEST(Surf_Validate, page_order_partial_and_gap)
{
    const std::vector<Diagnostic> partial = diagnose("::site\n"
                                                     ":::page[route=/a order=1]\nA\n:::\n"
                                                     ":::page[route=/b]\nB\n:::\n"
                                                     "::\n");
    ASSERT_EQ(partial.size(), 1);
    EXPECT_EQ(partial[0].pos.line, 0);

    const std::vector<Diagnostic> gap = diagnose("::site\n"
                                                 ":::page[route=/a order=1]\nA\n:::\n"
                                                 ":::page[route=/b order=3]\nB\n:::\n"
                                                 "::\n");
    ASSERT_EQ(gap.size(), 1);
    EXPECT_EQ(gap[0].code, Diagnostic_Code::page_order_ambiguous);
    EXPECT_EQ(gap[0].pos.line, 4);
}

TEST(Surf_Validate, order_pages)
{
    const Parsed_Document parsed = parse("::site\n"
                                         ":::page[route=/loose]\n:::\n"
                                         ":::page[route=/second order=2]\n:::\n"
                                         ":::page[route=/first order=1]\n:::\n"
                                         ":::page[route=/tie order=2]\n:::\n"
                                         "::\n");
    const auto& site = std::get<ast::Site>(parsed.document.blocks.at(0));
    const std::vector<const ast::Page*> pages = order_pages(site);
    ASSERT_EQ(pages.size(), 4);
    EXPECT_EQ(pages[0]->route, "/first");
    EXPECT_EQ(pages[1]->route, "/second");
    EXPECT_EQ(pages[2]->route, "/tie");
    EXPECT_EQ(pages[3]->route, "/loose");
}

TEST(Surf_Validate, front_matter)
{
    EXPECT_TRUE(parse("Text", { { "title", "T" }, { "type", "report" } }).diagnostics.empty());
    EXPECT_TRUE(parse("Text").diagnostics.empty());

    const std::vector<Diagnostic> missing = parse("Text", { { "author", "A" } }).diagnostics;
    EXPECT_EQ(count_of(missing, Diagnostic_Code::front_matter_field_missing), 2);
    EXPECT_FALSE(has_errors(missing));

    const std::vector<Diagnostic> invalid = parse("Text",
                                                  { { "title", "T" },
                                                    { "type", "memo" },
                                                    { "status", "active" },
                                                    { "scope", "workspace-private" },
                                                    { "confidence", "certain" },
                                                    { "version", "two" } })
                                                .diagnostics;
    EXPECT_EQ(count_of(invalid, Diagnostic_Code::front_matter_value_invalid), 3);
    EXPECT_EQ(count_of(invalid, Diagnostic_Code::front_matter_field_missing), 0);
    EXPECT_EQ(first_of(invalid, Diagnostic_Code::front_matter_value_invalid).pos.begin, 0);
}

TEST(Surf_Validate, repeatable)
{
    const Parsed_Document parsed = parse("::callout\nx\n::\n::figure[src=a]\n");
    EXPECT_EQ(validate(parsed.document), parsed.diagnostics);
    EXPECT_EQ(validate(parsed.document), validate(parsed.document));
}

TEST(Surf_Validate, empty_nav)
{
    const std::vector<Diagnostic> diagnostics = diagnose("::nav[logo=Acme]\nJust text.\n::\n");
    ASSERT_EQ(diagnostics.size(), 1);
    EXPECT_EQ(diagnostics[0].code, Diagnostic_Code::empty_container);
    EXPECT_TRUE(diagnose("::nav\n- [Home](/)\n::\n").empty());
}

} // namespace
} // namespace surfdoc
