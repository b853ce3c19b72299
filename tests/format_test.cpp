#include "common.hpp"

#include <atomic>
#include <thread>

#include "image/avif.hpp"
#include "image/capability.hpp"
#include "image/format.hpp"
#include "image/transform.hpp"
#include "image/utils.hpp"

using namespace Image;

int main(const int argc, char *argv[]) {
    return Catch::Session().run(argc, argv);
}

TEST_CASE("MapQuality") {
    SECTION("Out of range values clamp to the nearest boundary") {
        REQUIRE(MapQuality(-5, Format::Jpeg) == MapQuality(0, Format::Jpeg));
        REQUIRE(MapQuality(250, Format::Jpeg) == MapQuality(100, Format::Jpeg));
        REQUIRE(MapQuality(-1, Format::Png) == 0);
        REQUIRE(MapQuality(101, Format::Png) == 9);
        REQUIRE(MapQuality(1000, Format::Webp) == 100);
    }

    SECTION("PNG compression level") {
        REQUIRE(MapQuality(100, Format::Png) == 9);
        REQUIRE(MapQuality(0, Format::Png) == 0);
        REQUIRE(MapQuality(50, Format::Png) == 5);
        REQUIRE(MapQuality(80, Format::Png) == 7);
    }

    SECTION("Lossy formats keep the 0-100 scale") {
        REQUIRE(MapQuality(80, Format::Jpeg) == 80);
        REQUIRE(MapQuality(80, Format::Webp) == 80);
        REQUIRE(MapQuality(33, Format::Avif) == 33);
    }

    SECTION("GIF and BMP have no quality") {
        for (const int q : {-10, 0, 1, 50, 80, 100, 200}) {
            REQUIRE_FALSE(MapQuality(q, Format::Gif).has_value());
            REQUIRE_FALSE(MapQuality(q, Format::Bmp).has_value());
        }
    }
}

TEST_CASE("AvifQuantizer") {
    REQUIRE(AvifQuantizer(100) == AVIF_QUANTIZER_BEST_QUALITY);
    REQUIRE(AvifQuantizer(0) == AVIF_QUANTIZER_WORST_QUALITY);
    REQUIRE(AvifQuantizer(50) == 32);
    REQUIRE(AvifQuantizer(80) == 13);
    REQUIRE(AvifQuantizer(-30) == AvifQuantizer(0));
    REQUIRE(AvifQuantizer(300) == AvifQuantizer(100));
    for (int q = 1; q <= 100; ++q) {
        REQUIRE(AvifQuantizer(q) <= AvifQuantizer(q - 1));
    }
}

TEST_CASE("ParseFormat") {
    REQUIRE(NormalizeMime("WebP") == "image/webp");
    REQUIRE(MimeType(Format::Jpeg) == "image/jpeg");
    REQUIRE(FormatFromMime("image/gif") == Format::Gif);
    REQUIRE_FALSE(FormatFromMime("image/tiff").has_value());

    auto parsed = ParseFormat("PNG");
    REQUIRE(imgconv::Ok(parsed));
    REQUIRE(std::get<Format>(parsed) == Format::Png);

    auto rejected = ParseFormat("jpg");
    REQUIRE_FALSE(imgconv::Ok(rejected));
    REQUIRE(std::get<imgconv::Failure>(rejected).Kind == imgconv::ErrorKind::Format);
    REQUIRE_THROWS_AS(imgconv::Unwrap(std::move(rejected)), imgconv::FormatError);
}

TEST_CASE("Raise") {
    using imgconv::ErrorKind;
    REQUIRE_THROWS_AS(imgconv::Raise(imgconv::Fail(ErrorKind::Environment, "x")), imgconv::EnvironmentError);
    REQUIRE_THROWS_AS(imgconv::Raise(imgconv::Fail(ErrorKind::Format, "x")), imgconv::FormatError);
    REQUIRE_THROWS_AS(imgconv::Raise(imgconv::Fail(ErrorKind::File, "x")), imgconv::FileError);
    REQUIRE_THROWS_AS(imgconv::Raise(imgconv::Fail(ErrorKind::Transform, "x")), imgconv::TransformError);
    REQUIRE_THROWS_AS(imgconv::Raise(imgconv::Fail(ErrorKind::Encode, "{} {}", 1, 2)), imgconv::EncodeError);
    REQUIRE_NOTHROW(imgconv::Check(std::nullopt));

    const imgconv::FileError withPath(fs::path("a.png"), "Failed to open file");
    REQUIRE(std::string(withPath.what()) == "Failed to open file (while opening: a.png)");
    REQUIRE(withPath.kind() == ErrorKind::File);
}

TEST_CASE("FilterCapabilities") {
    const std::vector<std::string> reported = {
        "image/jpeg", "image/png",  "image/x-portable-anymap", "image/jpeg",         "IMAGE/GIF",
        "webp",       "image/tiff", "image/bmp; charset=none",  "application/x-whatever"};
    const std::set<std::string> expected = {"image/jpeg", "image/png", "image/gif", "image/webp", "image/bmp"};
    REQUIRE(FilterCapabilities(reported) == expected);
    REQUIRE(FilterCapabilities({}).empty());
}

TEST_CASE("CapabilityCache") {
    std::atomic<int> calls = 0;
    CapabilityCache cache([&calls] {
        ++calls;
        return std::vector<std::string>{"image/png", "image/avif", "image/tiff"};
    });

    SECTION("Queries once") {
        const auto &first = cache.Get();
        const auto &second = cache.Get();
        REQUIRE(&first == &second);
        REQUIRE(first == std::set<std::string>{"image/avif", "image/png"});
        REQUIRE(calls == 1);
    }

    SECTION("Concurrent first access") {
        std::vector<std::thread> threads;
        std::vector<const std::set<std::string> *> seen(8, nullptr);
        for (size_t i = 0; i < seen.size(); ++i) {
            threads.emplace_back([&cache, &seen, i] { seen[i] = &cache.Get(); });
        }
        for (auto &t : threads) {
            t.join();
        }
        REQUIRE(calls == 1);
        REQUIRE(std::ranges::all_of(seen, [&](const auto *p) { return p == seen.front(); }));
    }
}

TEST_CASE("CoverGeometry") {
    SECTION("100x50 into 60x60") {
        auto result = CoverGeometry(100, 50, 60, 60);
        REQUIRE(imgconv::Ok(result));
        const auto &plan = std::get<CoverPlan>(result);
        REQUIRE(plan.Scale == Catch::Approx(1.2));
        REQUIRE(plan.ScaledWidth == 120);
        REQUIRE(plan.ScaledHeight == 60);
        REQUIRE(plan.X == 30);
        REQUIRE(plan.Y == 0);
        REQUIRE(plan.Width == 60);
        REQUIRE(plan.Height == 60);
    }

    SECTION("Downscale keeps the wider side") {
        const auto plan = std::get<CoverPlan>(CoverGeometry(200, 100, 50, 50));
        REQUIRE(plan.Scale == 0.5);
        REQUIRE(plan.ScaledWidth == 100);
        REQUIRE(plan.ScaledHeight == 50);
        REQUIRE(plan.X == 25);
        REQUIRE(plan.Y == 0);
    }

    SECTION("Portrait target") {
        const auto plan = std::get<CoverPlan>(CoverGeometry(100, 50, 10, 40));
        REQUIRE(plan.ScaledWidth == 80);
        REQUIRE(plan.ScaledHeight == 40);
        REQUIRE(plan.X == 35);
        REQUIRE(plan.Y == 0);
    }

    SECTION("Crop region always lies inside the scaled image") {
        for (const unsigned w : {1u, 3u, 7u, 49u, 100u, 333u, 1000u, 4096u}) {
            for (const unsigned h : {1u, 2u, 9u, 50u, 101u, 777u, 3000u}) {
                for (const int tw : {1, 2, 13, 60, 257, 1024}) {
                    for (const int th : {1, 5, 60, 199, 2048}) {
                        const auto plan = std::get<CoverPlan>(CoverGeometry(w, h, tw, th));
                        INFO(w << "x" << h << " -> " << tw << "x" << th);
                        REQUIRE(plan.ScaledWidth >= plan.Width);
                        REQUIRE(plan.ScaledHeight >= plan.Height);
                        REQUIRE(plan.X + plan.Width <= plan.ScaledWidth);
                        REQUIRE(plan.Y + plan.Height <= plan.ScaledHeight);
                    }
                }
            }
        }
    }

    SECTION("Zero sized source") {
        auto result = CoverGeometry(0, 50, 60, 60);
        REQUIRE_FALSE(imgconv::Ok(result));
        REQUIRE(std::get<imgconv::Failure>(result).Kind == imgconv::ErrorKind::Transform);
    }

    SECTION("Scaled size beyond the bitmap limit") {
        auto wide = CoverGeometry(4096, 1, 1, 2000000000);
        REQUIRE_FALSE(imgconv::Ok(wide));
        REQUIRE(std::get<imgconv::Failure>(wide).Kind == imgconv::ErrorKind::Transform);

        auto tall = CoverGeometry(1, 3, 2000000000, 1);
        REQUIRE_FALSE(imgconv::Ok(tall));
        REQUIRE(std::get<imgconv::Failure>(tall).Kind == imgconv::ErrorKind::Transform);

        auto edge = CoverGeometry(1, 1, static_cast<int>(MaxDimension), 1);
        REQUIRE(imgconv::Ok(edge));
        REQUIRE(std::get<CoverPlan>(edge).ScaledWidth == MaxDimension);
    }

    SECTION("Resize needs both dimensions") {
        REQUIRE(WantsResize(60, 60));
        REQUIRE_FALSE(WantsResize(800, 0));
        REQUIRE_FALSE(WantsResize(0, 600));
        REQUIRE_FALSE(WantsResize(-1, 600));
        REQUIRE_FALSE(imgconv::Ok(CoverGeometry(100, 50, 800, 0)));
    }
}

TEST_CASE("Base64Encode") {
    auto encode = [](const std::string_view s) {
        const std::vector<uint8_t> bytes(s.begin(), s.end());
        return Base64Encode(bytes);
    };
    REQUIRE(encode("").empty());
    REQUIRE(encode("f") == "Zg==");
    REQUIRE(encode("fo") == "Zm8=");
    REQUIRE(encode("foo") == "Zm9v");
    REQUIRE(encode("foob") == "Zm9vYg==");
    REQUIRE(encode("fooba") == "Zm9vYmE=");
    REQUIRE(encode("foobar") == "Zm9vYmFy");

    const std::vector<uint8_t> binary = {0x00, 0xFF, 0xFE, 0x80, 0x7F};
    REQUIRE(DecodeBase64(Base64Encode(binary)) == binary);
}
