// Integration test for DICOM volume loading
// Loads the main volume of a real directory with VolumeLoader and compares
// the result with ITK's own series reader.
// Usage: test_series_loading <dicom_directory>

#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <itkGDCMImageIO.h>
#include <itkGDCMSeriesFileNames.h>
#include <itkImage.h>
#include <itkImageSeriesReader.h>

#include "core/dicom_file_utils.hpp"
#include "core/image_converter.hpp"
#include "core/reporting.hpp"
#include "core/slice_decoder.hpp"
#include "core/volume_loader.hpp"

namespace fs = std::filesystem;
using namespace dicom_stacker::core;

int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <dicom_directory>" << std::endl;
        return 1;
    }

    fs::path dicomDir = argv[1];
    if (!fs::is_directory(dicomDir)) {
        std::cerr << "Directory not found: " << dicomDir << std::endl;
        return 1;
    }

    std::cout << "=== DICOM Volume Loading Test ===" << std::endl;
    std::cout << "Directory: " << dicomDir << std::endl;

    int failures = 0;

    // Step 1: Load with VolumeLoader
    VolumeLoader loader(std::make_shared<GdcmSliceDecoder>(),
                        std::make_shared<LoggingReporting>());
    auto result = loader.loadMainImageFromDicomFiles(dicomDir, listDirectory(dicomDir));
    if (!result) {
        std::cerr << "[FAIL] " << result.error().message << std::endl;
        return 1;
    }

    const auto& loaded = *result;
    if (loaded.volume.empty()) {
        std::cerr << "[FAIL] First slice could not be decoded" << std::endl;
        return 1;
    }

    const auto shape = loaded.volume.shape();
    std::cout << "\n[PASS] Loaded volume " << shape[0] << " x " << shape[1] << " x " << shape[2]
              << " (" << toString(loaded.volume.datatype()) << ")" << std::endl;
    std::cout << "  Groups found: " << loaded.numberOfGroups << std::endl;
    std::cout << "  Slice thickness: " << loaded.sliceThickness << " mm" << std::endl;
    std::cout << "  Origin: [" << loaded.globalOriginMm[0] << ", " << loaded.globalOriginMm[1]
              << ", " << loaded.globalOriginMm[2] << "]" << std::endl;

    // Step 2: Positions must be non-decreasing
    bool ordered = true;
    for (size_t i = 1; i < loaded.sortedPositions.size(); ++i) {
        if (loaded.sortedPositions[i] < loaded.sortedPositions[i - 1]) {
            ordered = false;
        }
    }
    std::cout << (ordered ? "[PASS]" : "[FAIL]") << " Slice positions are sorted" << std::endl;
    failures += ordered ? 0 : 1;

    // Step 3: Compare with ITK's reader for the same series
    try {
        auto namesGenerator = itk::GDCMSeriesFileNames::New();
        namesGenerator->SetUseSeriesDetails(true);
        namesGenerator->SetRecursive(false);
        namesGenerator->SetDirectory(dicomDir.string());

        auto seriesUid = loaded.representativeMetadata.count(std::string(tags::SeriesInstanceUid))
            ? loaded.representativeMetadata.at(std::string(tags::SeriesInstanceUid))
            : std::string{};

        for (const auto& uid : namesGenerator->GetSeriesUIDs()) {
            const auto& fileNames = namesGenerator->GetFileNames(uid);
            if (fileNames.size() != shape[2] || uid.find(seriesUid) != 0) {
                continue;
            }

            using SeriesReaderType = itk::ImageSeriesReader<itk::Image<short, 3>>;
            auto seriesReader = SeriesReaderType::New();
            seriesReader->SetImageIO(itk::GDCMImageIO::New());
            seriesReader->SetFileNames(fileNames);
            seriesReader->Update();

            auto size = seriesReader->GetOutput()->GetLargestPossibleRegion().GetSize();
            bool sameSize = size[0] == shape[1] && size[1] == shape[0] && size[2] == shape[2];
            std::cout << (sameSize ? "[PASS]" : "[FAIL]") << " Size matches ITK: "
                      << size[0] << " x " << size[1] << " x " << size[2] << std::endl;
            failures += sameSize ? 0 : 1;

            if (loaded.sliceThickness > 0.0 && shape[2] > 2) {
                double itkSpacing = seriesReader->GetOutput()->GetSpacing()[2];
                bool sameSpacing = std::abs(itkSpacing - loaded.sliceThickness) < 1e-3;
                std::cout << (sameSpacing ? "[PASS]" : "[FAIL]") << " Slice spacing matches ITK: "
                          << itkSpacing << " mm" << std::endl;
                failures += sameSpacing ? 0 : 1;
            }
            break;
        }

        // Step 4: ITK conversion keeps the voxel count
        if (loaded.volume.datatype() == PixelDatatype::Int16 &&
            loaded.volume.samplesPerPixel() == 1) {
            auto image = ImageConverter::toCTImage(loaded);
            bool converted = image.has_value();
            std::cout << (converted ? "[PASS]" : "[FAIL]") << " Converted to ITK image" << std::endl;
            failures += converted ? 0 : 1;
        }

    } catch (const itk::ExceptionObject& e) {
        std::cerr << "\n[FAIL] ITK Exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== " << (failures == 0 ? "All checks passed" : "Some checks failed")
              << " ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
