#include "Orientation.h"

#include <exiv2/exiv2.hpp>
#include <map>

namespace PhotoDater
{
    const std::vector<TransformOp>& Orientation::operationsFor(int tag)
    {
        using Op = TransformOp;
        static const std::map<int, std::vector<TransformOp>> TABLE = {
            { 1, {} },
            { 2, { Op::FlipHorizontal } },
            { 3, { Op::Rotate180 } },
            { 4, { Op::FlipVertical } },
            { 5, { Op::FlipHorizontal, Op::Rotate270 } }, // transpose
            { 6, { Op::Rotate90 } },
            { 7, { Op::FlipHorizontal, Op::Rotate90 } },  // transverse
            { 8, { Op::Rotate270 } },
        };

        auto it = TABLE.find(tag);
        if (it == TABLE.end()) {
            return TABLE.at(DEFAULT_TAG);
        }
        return it->second;
    }

    void Orientation::applyOp(CImg<unsigned char>& img, TransformOp op)
    {
        switch (op)
        {
        case TransformOp::FlipHorizontal:
            img.mirror('x');
            break;
        case TransformOp::FlipVertical:
            img.mirror('y');
            break;
        case TransformOp::Rotate90:
            // Transpose then mirror columns: out(x,y) = in(y, H-1-x)
            img.permute_axes("yxzc").mirror('x');
            break;
        case TransformOp::Rotate180:
            img.mirror("xy");
            break;
        case TransformOp::Rotate270:
            // Transpose then mirror rows: out(x,y) = in(W-1-y, x)
            img.permute_axes("yxzc").mirror('y');
            break;
        }
    }

    void Orientation::apply(CImg<unsigned char>& img, int tag)
    {
        for (TransformOp op : operationsFor(tag)) {
            applyOp(img, op);
        }
    }

    int Orientation::readTag(const fs::path& imagePath)
    {
        try
        {
            auto image = Exiv2::ImageFactory::open(imagePath.string());
            image->readMetadata();

            const Exiv2::ExifData& exifData = image->exifData();
            auto pos = exifData.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
            if (pos == exifData.end() || pos->count() == 0) {
                return DEFAULT_TAG;
            }

            const auto tag = static_cast<int>(pos->toInt64());
            if (tag < 1 || tag > 8) {
                return DEFAULT_TAG;
            }
            return tag;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: could not read orientation of " << imagePath.filename().string()
                      << ", assuming upright. Reason: " << e.what() << std::endl;
            return DEFAULT_TAG;
        }
    }

} // namespace PhotoDater
