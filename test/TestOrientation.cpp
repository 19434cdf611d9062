#include "BaseTestFixture.h"

#include <functional>

class OrientationTest : public BaseTestFixture {
protected:
    static constexpr int W = 3;
    static constexpr int H = 2;

    // Every pixel holds a unique value so any misplacement is visible
    CImg<unsigned char> numbered() {
        CImg<unsigned char> img(W, H, 1, 1);
        cimg_forXY(img, x, y) { img(x, y) = static_cast<unsigned char>(y * W + x); }
        return img;
    }

    // Checks that out(x, y) == in(source(x, y)) for every output pixel
    void expectMapping(int tag, int outW, int outH, const std::function<std::pair<int, int>(int, int)>& source) {
        CImg<unsigned char> in = numbered();
        CImg<unsigned char> out = numbered();
        Orientation::apply(out, tag);

        ASSERT_EQ(out.width(), outW) << "tag " << tag;
        ASSERT_EQ(out.height(), outH) << "tag " << tag;
        cimg_forXY(out, x, y) {
            auto [sx, sy] = source(x, y);
            ASSERT_EQ(out(x, y), in(sx, sy)) << "tag " << tag << " at (" << x << "," << y << ")";
        }
    }
};

TEST_F(OrientationTest, Identity) {
    expectMapping(1, W, H, [](int x, int y) { return std::make_pair(x, y); });
}

TEST_F(OrientationTest, FlipHorizontal) {
    expectMapping(2, W, H, [](int x, int y) { return std::make_pair(W - 1 - x, y); });
}

TEST_F(OrientationTest, Rotate180) {
    expectMapping(3, W, H, [](int x, int y) { return std::make_pair(W - 1 - x, H - 1 - y); });
}

TEST_F(OrientationTest, FlipVertical) {
    expectMapping(4, W, H, [](int x, int y) { return std::make_pair(x, H - 1 - y); });
}

TEST_F(OrientationTest, Transpose) {
    expectMapping(5, H, W, [](int x, int y) { return std::make_pair(y, x); });
}

TEST_F(OrientationTest, Rotate90Clockwise) {
    expectMapping(6, H, W, [](int x, int y) { return std::make_pair(y, H - 1 - x); });
}

TEST_F(OrientationTest, Transverse) {
    expectMapping(7, H, W, [](int x, int y) { return std::make_pair(W - 1 - y, H - 1 - x); });
}

TEST_F(OrientationTest, Rotate270Clockwise) {
    expectMapping(8, H, W, [](int x, int y) { return std::make_pair(W - 1 - y, x); });
}

TEST_F(OrientationTest, UnknownTagsAreIdentity) {
    ASSERT_TRUE(Orientation::operationsFor(0).empty());
    ASSERT_TRUE(Orientation::operationsFor(9).empty());
    ASSERT_TRUE(Orientation::operationsFor(-3).empty());
}

TEST_F(OrientationTest, TableShape) {
    ASSERT_EQ(Orientation::operationsFor(5),
              (std::vector<TransformOp>{TransformOp::FlipHorizontal, TransformOp::Rotate270}));
    ASSERT_EQ(Orientation::operationsFor(7),
              (std::vector<TransformOp>{TransformOp::FlipHorizontal, TransformOp::Rotate90}));
    ASSERT_EQ(Orientation::operationsFor(6), std::vector<TransformOp>{TransformOp::Rotate90});
}

TEST_F(OrientationTest, ReadTagFromJpeg) {
    fs::path rotated = inputDir / "rotated.jpg";
    writeJpeg(rotated, 60, 40, {10, 20, 30}, 6);
    ASSERT_EQ(Orientation::readTag(rotated), 6);
}

TEST_F(OrientationTest, ReadTagDefaultsToUpright) {
    fs::path plainJpeg = inputDir / "plain.jpg";
    fs::path plainPng = inputDir / "plain.png";
    fs::path notAnImage = inputDir / "notes.jpg";
    writeJpeg(plainJpeg, 20, 20);
    writePng(plainPng, 20, 20, {1, 2, 3});
    writeText(notAnImage, "definitely not a jpeg");

    ASSERT_EQ(Orientation::readTag(plainJpeg), 1);
    ASSERT_EQ(Orientation::readTag(plainPng), 1);
    ASSERT_EQ(Orientation::readTag(notAnImage), 1);
    ASSERT_EQ(Orientation::readTag(inputDir / "missing.jpg"), 1);
}
