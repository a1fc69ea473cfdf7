/**
 * @file main.cpp
 * @brief Entry point for the microphone icon generator.
 *
 * This file contains the main function which parses the command line,
 * renders the microphone icon at every supported size and writes the PNG
 * and ICO files into the output directory.
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include "iconexporter.h"

namespace {

// Historical location of the generated icons, relative to the project root
const char *DefaultOutputDirectory = "src-tauri/icons";

enum ExitCode {
    ExitSuccess = 0,
    ExitInvalidArguments = 1,
    ExitFilesystemError = 2,
    ExitVerificationFailed = 3
};

int exitCodeFor(IconExporter::ExportError error)
{
    switch (error) {
    case IconExporter::NoError:
        return ExitSuccess;
    case IconExporter::InvalidGeometry:
        return ExitInvalidArguments;
    case IconExporter::VerificationError:
        return ExitVerificationFailed;
    case IconExporter::FilesystemError:
    case IconExporter::EncodingError:
        break;
    }
    return ExitFilesystemError;
}

}

/**
 * @brief Main entry point for the icon generator.
 *
 * Accepts an optional output directory (default "src-tauri/icons"), an
 * optional "--padding <ratio>" override and "--verify" to re-read the
 * written files afterwards.
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 * @return 0 on success, non-zero if rendering, writing or verification failed.
 */
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("micicongen");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Generates the microphone tray and window icons.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption paddingOption("padding",
                                     "Fraction of the icon size left empty on each side.",
                                     "ratio",
                                     QString::number(MicIconRenderer::DefaultPaddingRatio));
    QCommandLineOption verifyOption("verify", "Re-read the written icons and check their sizes.");
    parser.addOption(paddingOption);
    parser.addOption(verifyOption);
    parser.addPositionalArgument("output-dir",
                                 QString("Directory for the icon files (default: %1).")
                                     .arg(QString::fromLatin1(DefaultOutputDirectory)));
    parser.process(app);

    bool ok = false;
    const double paddingRatio = parser.value(paddingOption).toDouble(&ok);
    if (!ok) {
        qCritical().noquote() << "Invalid padding ratio:" << parser.value(paddingOption);
        return ExitInvalidArguments;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        qCritical() << "Expected at most one output directory, got" << positional.size();
        return ExitInvalidArguments;
    }
    const QString outputDirectory = positional.isEmpty() ? QString(DefaultOutputDirectory)
                                                         : positional.first();

    qDebug() << "Writing icons to" << QDir::toNativeSeparators(outputDirectory)
             << "with padding ratio" << paddingRatio;

    IconExporter exporter(paddingRatio);
    if (!exporter.exportTo(outputDirectory)) {
        qCritical().noquote() << "Icon export failed:" << exporter.errorString();
        return exitCodeFor(exporter.error());
    }

    if (parser.isSet(verifyOption)) {
        if (!exporter.verifyOutput(outputDirectory)) {
            qCritical().noquote() << "Icon verification failed:" << exporter.errorString();
            return exitCodeFor(exporter.error());
        }
        qInfo() << "Icon verification passed";
    }

    return ExitSuccess;
}
