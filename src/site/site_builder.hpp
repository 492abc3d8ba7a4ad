#pragma once

#include <QList>
#include <QString>

#include "core/ledger.hpp"
#include "core/result.hpp"
#include "site/build_options.hpp"
#include "site/problem_reporter.hpp"

namespace slate::site {

struct BuildSummary {
    int pagesWritten = 0;
    int assetsCopied = 0;
    QList<Problem> problems;
};

// True when root holds index.dj, index.djot or index.md at its top level.
[[nodiscard]] bool has_index_page(const QString& root);

// Pass two: fills in each page's table of contents and writes it below outputRoot.
[[nodiscard]] Result<int> write_pages(const Ledger& ledger, const QString& outputRoot, const QString& webPrefix);

/**
 * Runs the whole pipeline for one set of options: optional clean, index
 * check, first pass (walk, render, copy), second pass (table of contents,
 * write). The ledger lives only for the duration of build().
 */
class SiteBuilder {
public:
    explicit SiteBuilder(BuildOptions options);

    [[nodiscard]] Result<BuildSummary> build();

    [[nodiscard]] const ProblemReporter& reporter() const { return reporter_; }

private:
    [[nodiscard]] Status clean_output() const;
    [[nodiscard]] Result<Ledger> first_pass(int& assetsCopied);

    BuildOptions options_;
    ProblemReporter reporter_;
};

} // namespace slate::site
