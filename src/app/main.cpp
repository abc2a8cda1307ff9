#include "core/dicom_file_utils.hpp"
#include "core/logging.hpp"
#include "core/reporting.hpp"
#include "core/slice_decoder.hpp"
#include "core/volume_loader.hpp"
#include "core/volume_serializer.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QStringList>

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::string joinShape(const std::vector<size_t>& shape)
{
    std::string text;
    for (size_t dim : shape) {
        if (!text.empty()) {
            text += " x ";
        }
        text += std::to_string(dim);
    }
    return text;
}

}  // anonymous namespace

/**
 * @brief Command-line entry point
 *
 * Loads the main volume of a DICOM directory and prints its geometry.
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dicom_stacker");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");
    app.setOrganizationDomain("github.com/kcenon");

    QSettings settings;

    QCommandLineParser parser;
    parser.setApplicationDescription("Assemble a 3D volume from a directory of DICOM slices");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("directory", "Directory containing the DICOM files");
    parser.addPositionalArgument("files", "Files to load (default: every file in the directory)",
                                 "[files...]");

    QCommandLineOption jsonOption("json", "Write a JSON summary of the volume to <file>", "file");
    QCommandLineOption logLevelOption(
        "log-level", "trace, debug, info, warning, error, critical or off", "level",
        settings.value("logging/level", "info").toString());
    QCommandLineOption logDirOption(
        "log-dir", "Also write a rotating log file to <directory>", "directory",
        settings.value("logging/directory").toString());
    parser.addOption(jsonOption);
    parser.addOption(logLevelOption);
    parser.addOption(logDirOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    dicom_stacker::logging::LogConfig logConfig;
    logConfig.level = dicom_stacker::logging::logLevelFromString(
        parser.value(logLevelOption).toStdString());
    if (!parser.value(logDirOption).isEmpty()) {
        logConfig.enableFileLogging = true;
        logConfig.logDirectory = parser.value(logDirOption).toStdString();
        std::error_code ec;
        std::filesystem::create_directories(logConfig.logDirectory, ec);
    }
    dicom_stacker::logging::LoggerFactory::configure(logConfig);

    settings.setValue("logging/level",
                      QString::fromStdString(dicom_stacker::logging::toString(logConfig.level)));
    settings.setValue("logging/directory", parser.value(logDirOption));

    const std::filesystem::path directory = positional.front().toStdString();
    if (!std::filesystem::is_directory(directory)) {
        std::cerr << "Directory not found: " << directory.string() << std::endl;
        return 1;
    }

    std::vector<dicom_stacker::core::DicomFileEntry> files;
    if (positional.size() > 1) {
        for (qsizetype i = 1; i < positional.size(); ++i) {
            files.emplace_back(positional.at(i).toStdString());
        }
    } else {
        files = dicom_stacker::core::listDirectory(directory);
    }

    dicom_stacker::core::VolumeLoader loader(
        std::make_shared<dicom_stacker::core::GdcmSliceDecoder>(),
        std::make_shared<dicom_stacker::core::LoggingReporting>());

    auto result = loader.loadMainImageFromDicomFiles(directory, files);
    if (!result) {
        std::cerr << "Failed to load volume: " << result.error().message << std::endl;
        dicom_stacker::logging::LoggerFactory::shutdown();
        return 1;
    }

    const auto& loaded = *result;
    if (loaded.volume.empty()) {
        std::cout << "No pixel data could be decoded from the first slice; the volume is empty."
                  << std::endl;
    } else {
        std::cout << "Volume: " << joinShape(loaded.volume.shape()) << " ("
                  << dicom_stacker::core::toString(loaded.volume.datatype()) << ")" << std::endl;
    }

    if (loaded.sliceThickness > 0.0) {
        std::cout << std::format("Slice thickness: {:.4f} mm", loaded.sliceThickness) << std::endl;
    } else {
        std::cout << "Slice thickness: unknown" << std::endl;
    }
    std::cout << std::format("Origin: [{:.3f}, {:.3f}, {:.3f}] mm",
                             loaded.globalOriginMm[0], loaded.globalOriginMm[1],
                             loaded.globalOriginMm[2]) << std::endl;
    std::cout << "Coherent groups: " << loaded.numberOfGroups << std::endl;

    if (parser.isSet(jsonOption)) {
        auto saved = dicom_stacker::core::VolumeSerializer::saveToFile(
            loaded, parser.value(jsonOption).toStdString());
        if (!saved) {
            std::cerr << saved.error().message << std::endl;
            dicom_stacker::logging::LoggerFactory::shutdown();
            return 1;
        }
    }

    dicom_stacker::logging::LoggerFactory::shutdown();
    return 0;
}
