#include <gtest/gtest.h>

#include <barrace/export.hpp>

using namespace barrace;

namespace
{

PixelBuffer gradient(uint32_t w, uint32_t h)
{
    PixelBuffer buf(w, h);
    for (uint32_t y = 0; y < h; ++y)
    {
        for (uint32_t x = 0; x < w; ++x)
        {
            size_t idx        = (static_cast<size_t>(y) * w + x) * 4;
            buf.rgba[idx + 0] = static_cast<uint8_t>((x * 255) / w);
            buf.rgba[idx + 1] = static_cast<uint8_t>((y * 255) / h);
            buf.rgba[idx + 2] = 64;
            buf.rgba[idx + 3] = 255;
        }
    }
    return buf;
}

}  // namespace

TEST(PngExport, Signature)
{
    auto png = ImageExporter::encode_png(gradient(16, 8));
    ASSERT_GT(png.size(), 8u);
    const uint8_t sig[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    for (size_t i = 0; i < 8; ++i)
        EXPECT_EQ(png[i], sig[i]) << "byte " << i;
}

TEST(PngExport, RejectsEmptyInput)
{
    EXPECT_TRUE(ImageExporter::encode_png(nullptr, 4, 4).empty());
    PixelBuffer empty;
    EXPECT_TRUE(ImageExporter::encode_png(empty).empty());
}

TEST(PngExport, SnapshotIsByteIdentical)
{
    FrameSource source = [](uint32_t i) { return gradient(32 + i, 16); };
    auto        a      = snapshot(source, 3);
    auto        b      = snapshot(source, 3);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, snapshot(source, 4));
}
