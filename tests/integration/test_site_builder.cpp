#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "site/site_builder.hpp"

using namespace slate;
using namespace slate::site;

namespace {

const QString NAV_TEMPLATE =
    QStringLiteral("<html><nav><!-- {TABLE_OF_CONTENTS} --></nav><main><!-- {CONTENT} --></main></html>");

void writeText(const QString& filePath, const QString& text) {
    QDir().mkpath(QFileInfo(filePath).absolutePath());
    QFile f(filePath);
    REQUIRE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(text.toUtf8());
}

QString readAllText(const QString& filePath) {
    QFile f(filePath);
    if (!f.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QString::fromUtf8(f.readAll());
}

// Index linking into nested2, nested2 linking back, nested3 linking across.
void writeLinkedSite(const QDir& source) {
    writeText(source.filePath("index.dj"),
              QStringLiteral("# Hey everyone!\n\nThis is an example djot file!\n\n"
                             "> Hey what's up. Link:\n\n[HIHIDHI](nested2/hey.dj)"));
    writeText(source.filePath("nested2/hey.dj"), QStringLiteral("File 2\n\n### Hey\n\n[link](../index.dj)"));
    writeText(source.filePath("nested3/third_file.dj"),
              QStringLiteral("File 3\n\n### What's good in the hous\n\n[link](../nested2/hey.dj)"));
}

BuildOptions optionsFor(const QTemporaryDir& tmp) {
    BuildOptions options;
    options.sourcePath = QDir(tmp.path()).filePath("target");
    options.outputPath = QDir(tmp.path()).filePath("output");
    return options;
}

} // namespace

TEST_CASE("SiteBuilder: linked site renders every page", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    writeLinkedSite(QDir(options.sourcePath));

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().pagesWritten == 3);
    REQUIRE(result.unwrap().problems.isEmpty());

    const QDir out(options.outputPath);
    REQUIRE(QFileInfo::exists(out.filePath("index.html")));
    REQUIRE_FALSE(QFileInfo::exists(out.filePath("index.dj")));
    REQUIRE(QFileInfo::exists(out.filePath("nested2/hey.html")));
    REQUIRE_FALSE(QFileInfo::exists(out.filePath("nested2/hey.dj")));
    REQUIRE(QFileInfo::exists(out.filePath("nested3/third_file.html")));
    REQUIRE_FALSE(QFileInfo::exists(out.filePath("nested3/third_file.dj")));

    const auto index = readAllText(out.filePath("index.html"));
    REQUIRE(index.contains(QStringLiteral("<h1 id=\"Hey-everyone\">Hey everyone!</h1>")));
    REQUIRE(index.contains(QStringLiteral("<a href=\"nested2/hey.html\">HIHIDHI</a>")));
    REQUIRE(readAllText(out.filePath("nested2/hey.html")).contains(QStringLiteral("href=\"../index.html\"")));
    REQUIRE(readAllText(out.filePath("nested3/third_file.html"))
                .contains(QStringLiteral("href=\"../nested2/hey.html\"")));
}

TEST_CASE("SiteBuilder: template pages get their table of contents", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeLinkedSite(source);
    writeText(source.filePath("template.html"), NAV_TEMPLATE);

    SiteBuilder builder(options);
    REQUIRE(builder.build().is_ok());

    const QDir out(options.outputPath);
    REQUIRE_FALSE(QFileInfo::exists(out.filePath("template.html")));

    const auto index = readAllText(out.filePath("index.html"));
    REQUIRE(index.startsWith(QStringLiteral(
        "<html><nav><ul>"
        "<li><b>index</b></li>"
        "<li><b><u>nested2:</u></b></li><ul><li><a href=\"nested2/hey.html\">hey</a></li></ul>"
        "<li><b><u>nested3:</u></b></li><ul><li><a href=\"nested3/third_file.html\">third_file</a></li></ul>"
        "</ul></nav><main>")));
    REQUIRE_FALSE(index.contains(QStringLiteral("<!-- {TABLE_OF_CONTENTS} -->")));
    REQUIRE_FALSE(index.contains(QStringLiteral("<!-- {CONTENT} -->")));

    const auto hey = readAllText(out.filePath("nested2/hey.html"));
    REQUIRE(hey.contains(QStringLiteral("<li><a href=\"../index.html\">index</a></li>")));
    REQUIRE(hey.contains(QStringLiteral("<li><b>hey</b></li>")));
}

TEST_CASE("SiteBuilder: nested template.html applies below its folder", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeLinkedSite(source);
    writeText(source.filePath("nested3/template.html"), QStringLiteral("<article><!-- {CONTENT} --></article>"));

    SiteBuilder builder(options);
    REQUIRE(builder.build().is_ok());

    const QDir out(options.outputPath);
    REQUIRE(readAllText(out.filePath("nested3/third_file.html")).startsWith(QStringLiteral("<article>")));
    REQUIRE_FALSE(readAllText(out.filePath("index.html")).contains(QStringLiteral("<article>")));
}

TEST_CASE("SiteBuilder: forced template beats template.html", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeLinkedSite(source);
    writeText(source.filePath("template.html"), QStringLiteral("CUSTOM <!-- {CONTENT} -->"));
    options.forcedTemplate = QStringLiteral("default");

    SiteBuilder builder(options);
    REQUIRE(builder.build().is_ok());

    const auto index = readAllText(QDir(options.outputPath).filePath("index.html"));
    REQUIRE(index.startsWith(QStringLiteral("<!DOCTYPE html>")));
    REQUIRE_FALSE(index.contains(QStringLiteral("CUSTOM")));
    REQUIRE(index.contains(QStringLiteral("<nav><ul><li><b>index</b></li>")));
}

TEST_CASE("SiteBuilder: missing index warns when lenient", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeText(source.filePath("nested/example.dj"),
              QStringLiteral("# Hey everyone!\n\nThis is an example djot file!\n\n> Hey what's up"));
    writeText(source.filePath("example2.dj"), QStringLiteral("# Hey everyone!\n\nThis is another file"));

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_ok());
    REQUIRE(builder.reporter().count(ErrorKind::MissingIndex) == 1);
    REQUIRE(result.unwrap().problems.size() == 1);

    const QDir out(options.outputPath);
    REQUIRE(QFileInfo::exists(out.filePath("example2.html")));
    REQUIRE(QFileInfo::exists(out.filePath("nested/example.html")));
}

TEST_CASE("SiteBuilder: missing index fails when strict", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    options.strict = true;
    writeText(QDir(options.sourcePath).filePath("example2.dj"), QStringLiteral("text"));

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::MissingIndex);
    REQUIRE(result.unwrap_err().message.find("index.{dj|djot|md} not found!") != std::string::npos);
    REQUIRE_FALSE(QFileInfo::exists(QDir(options.outputPath).filePath("example2.html")));
}

TEST_CASE("SiteBuilder: dangling links are rewritten and reported", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    writeText(QDir(options.sourcePath).filePath("index.dj"), QStringLiteral("[later](drafts/later.dj)"));

    SECTION("lenient") {
        SiteBuilder builder(options);
        const auto result = builder.build();
        REQUIRE(result.is_ok());
        REQUIRE(builder.reporter().count(ErrorKind::DanglingLink) == 1);
        REQUIRE(readAllText(QDir(options.outputPath).filePath("index.html"))
                    .contains(QStringLiteral("href=\"drafts/later.html\"")));
    }

    SECTION("strict") {
        options.strict = true;
        SiteBuilder builder(options);
        const auto result = builder.build();
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::DanglingLink);
        REQUIRE(QString::fromStdString(result.unwrap_err().path).endsWith(QStringLiteral("drafts/later.dj")));
    }
}

TEST_CASE("SiteBuilder: web prefix reaches content links and navigation", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeLinkedSite(source);
    writeText(source.filePath("template.html"), NAV_TEMPLATE);
    options.webPrefix = QStringLiteral("/docs/");

    SiteBuilder builder(options);
    REQUIRE(builder.build().is_ok());

    const auto index = readAllText(QDir(options.outputPath).filePath("index.html"));
    REQUIRE(index.contains(QStringLiteral("<a href=\"/docs/nested2/hey.html\">HIHIDHI</a>")));
    REQUIRE(index.contains(QStringLiteral("<li><a href=\"/docs/nested3/third_file.html\">third_file</a></li>")));
}

TEST_CASE("SiteBuilder: assets are copied byte for byte", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeText(source.filePath("index.md"), QStringLiteral("# Home\n\n![logo](img/logo.svg)"));
    writeText(source.filePath("style.css"), QStringLiteral("body { color: #333; }\n"));
    writeText(source.filePath("img/logo.svg"), QStringLiteral("<svg/>"));

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().assetsCopied == 2);
    REQUIRE(result.unwrap().pagesWritten == 1);

    const QDir out(options.outputPath);
    REQUIRE(readAllText(out.filePath("style.css")) == QStringLiteral("body { color: #333; }\n"));
    REQUIRE(readAllText(out.filePath("img/logo.svg")) == QStringLiteral("<svg/>"));
    REQUIRE(readAllText(out.filePath("index.html")).contains(QStringLiteral("<h1>Home</h1>")));

    writeText(source.filePath("style.css"), QStringLiteral("body { color: red; }\n"));
    SiteBuilder again(options);
    REQUIRE(again.build().is_ok());
    REQUIRE(readAllText(out.filePath("style.css")) == QStringLiteral("body { color: red; }\n"));
}

TEST_CASE("SiteBuilder: hidden files and folders are published", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeText(source.filePath("index.dj"), QStringLiteral("home"));
    writeText(source.filePath(".nojekyll"), QString());
    writeText(source.filePath(".well-known/x.txt"), QStringLiteral("x"));
    writeText(source.filePath(".draft.dj"), QStringLiteral("_draft_"));

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().assetsCopied == 2);
    REQUIRE(result.unwrap().pagesWritten == 2);

    const QDir out(options.outputPath);
    REQUIRE(QFileInfo::exists(out.filePath(".nojekyll")));
    REQUIRE(readAllText(out.filePath(".well-known/x.txt")) == QStringLiteral("x"));
    REQUIRE(readAllText(out.filePath(".draft.html")).contains(QStringLiteral("<em>draft</em>")));
    REQUIRE_FALSE(QFileInfo::exists(out.filePath(".draft.dj")));
}

TEST_CASE("SiteBuilder: output path equal to the source is refused", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeText(source.filePath("index.dj"), QStringLiteral("home"));
    writeText(source.filePath("logo.png"), QStringLiteral("png"));
    options.outputPath = options.sourcePath + QStringLiteral("/.");
    options.clean = true;

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
    REQUIRE(readAllText(source.filePath("logo.png")) == QStringLiteral("png"));
    REQUIRE(readAllText(source.filePath("index.dj")) == QStringLiteral("home"));
    REQUIRE_FALSE(QFileInfo::exists(source.filePath("index.html")));
}

TEST_CASE("SiteBuilder: unreadable entries are traversal problems", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeText(source.filePath("index.dj"), QStringLiteral("home"));
    writeText(source.filePath("zeta.dj"), QStringLiteral("after"));
    REQUIRE(QFile::link(QDir(tmp.path()).filePath("missing.png"), source.filePath("broken.png")));

    SECTION("lenient") {
        SiteBuilder builder(options);
        const auto result = builder.build();
        REQUIRE(result.is_ok());
        REQUIRE(builder.reporter().count(ErrorKind::TraversalEntry) == 1);
        REQUIRE(result.unwrap().pagesWritten == 2);
        REQUIRE(result.unwrap().assetsCopied == 0);

        const QDir out(options.outputPath);
        REQUIRE(QFileInfo::exists(out.filePath("zeta.html")));
        REQUIRE_FALSE(QFileInfo::exists(out.filePath("broken.png")));
    }

    SECTION("strict") {
        options.strict = true;
        SiteBuilder builder(options);
        const auto result = builder.build();
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::TraversalEntry);
        REQUIRE(QString::fromStdString(result.unwrap_err().path).endsWith(QStringLiteral("broken.png")));
    }
}

TEST_CASE("SiteBuilder: rebuilding produces identical output", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);
    const QDir source(options.sourcePath);
    writeLinkedSite(source);
    writeText(source.filePath("template.html"), NAV_TEMPLATE);

    const QDir out(options.outputPath);
    const QStringList pages = {QStringLiteral("index.html"), QStringLiteral("nested2/hey.html"),
                               QStringLiteral("nested3/third_file.html")};

    SiteBuilder first(options);
    REQUIRE(first.build().is_ok());
    QStringList before;
    for (const auto& page : pages) {
        before.append(readAllText(out.filePath(page)));
    }

    SiteBuilder second(options);
    REQUIRE(second.build().is_ok());
    for (qsizetype i = 0; i < pages.size(); i++) {
        REQUIRE(readAllText(out.filePath(pages[i])) == before[i]);
    }
}

TEST_CASE("SiteBuilder: clean removes stale output", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    writeText(QDir(options.sourcePath).filePath("index.dj"), QStringLiteral("home"));
    const auto stale = QDir(options.outputPath).filePath("old/page.html");
    writeText(stale, QStringLiteral("stale"));

    SECTION("without clean stale files stay") {
        SiteBuilder builder(options);
        REQUIRE(builder.build().is_ok());
        REQUIRE(QFileInfo::exists(stale));
    }

    SECTION("with clean they are gone") {
        options.clean = true;
        SiteBuilder builder(options);
        REQUIRE(builder.build().is_ok());
        REQUIRE_FALSE(QFileInfo::exists(stale));
        REQUIRE(QFileInfo::exists(QDir(options.outputPath).filePath("index.html")));
    }
}

TEST_CASE("SiteBuilder: output directory inside the source is not walked", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    auto options = optionsFor(tmp);
    options.outputPath = QDir(options.sourcePath).filePath("output");
    writeText(QDir(options.sourcePath).filePath("index.dj"), QStringLiteral("home"));
    writeText(QDir(options.sourcePath).filePath("logo.png"), QStringLiteral("png"));

    SiteBuilder first(options);
    REQUIRE(first.build().is_ok());
    SiteBuilder second(options);
    const auto result = second.build();
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().assetsCopied == 1);
    REQUIRE(result.unwrap().pagesWritten == 1);
    REQUIRE_FALSE(QFileInfo::exists(QDir(options.outputPath).filePath("output")));
}

TEST_CASE("SiteBuilder: single file mode renders one page", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const QDir root(tmp.path());
    writeText(root.filePath("notes/page.dj"), QStringLiteral("# Notes\n\n[other](other.dj)"));
    writeText(root.filePath("notes/other.dj"), QStringLiteral("other"));
    writeText(root.filePath("notes/template.html"), NAV_TEMPLATE);

    BuildOptions options;
    options.sourcePath = root.filePath("notes/page.dj");
    options.outputPath = root.filePath("out");
    options.singleFile = true;

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().pagesWritten == 1);
    REQUIRE(builder.reporter().problems().isEmpty());

    const auto page = readAllText(root.filePath("out/page.html"));
    REQUIRE(page.contains(QStringLiteral("<nav><ul><li><b>page</b></li></ul></nav>")));
    REQUIRE(page.contains(QStringLiteral("href=\"other.html\"")));
    REQUIRE_FALSE(QFileInfo::exists(root.filePath("out/other.html")));
}

TEST_CASE("SiteBuilder: source must be a directory", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto options = optionsFor(tmp);

    SiteBuilder builder(options);
    const auto result = builder.build();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
}

TEST_CASE("write_pages: fills each page's table of contents", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const Ledger ledger = {
        DirEntry{0, ""},
        PageEntry{1, "index.html", "<nav><!-- {TABLE_OF_CONTENTS} --></nav>"},
        DirEntry{1, "guide"},
        PageEntry{2, "guide/start.html", "<nav><!-- {TABLE_OF_CONTENTS} --></nav>"},
    };

    const auto written = write_pages(ledger, tmp.path(), QString());
    REQUIRE(written.is_ok());
    REQUIRE(written.unwrap() == 2);

    const QDir out(tmp.path());
    REQUIRE(readAllText(out.filePath("guide/start.html")) ==
            QStringLiteral("<nav><ul><li><a href=\"../index.html\">index</a></li>"
                           "<li><b><u>guide:</u></b></li><ul><li><b>start</b></li></ul></ul></nav>"));
}

TEST_CASE("has_index_page: accepts every markup extension", "[site]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const QDir root(tmp.path());
    REQUIRE_FALSE(has_index_page(root.path()));

    writeText(root.filePath("index.djot"), QStringLiteral("home"));
    REQUIRE(has_index_page(root.path()));
}
