#pragma once

#include <QString>

namespace slate::site {

/**
 * Run-wide configuration, passed explicitly into every component that needs
 * part of it.
 */
struct BuildOptions {
    // Source directory, or the single document when singleFile is set.
    QString sourcePath;
    QString outputPath;
    bool singleFile = false;
    // Remove outputPath before building.
    bool clean = false;
    // Prepended to every generated intra-site link.
    QString webPrefix;
    // Built-in template name or template file path; overrides any template.html.
    QString forcedTemplate;
    // Escalate reportable problems (missing index, dangling links, ...) to errors.
    bool strict = false;
};

} // namespace slate::site
