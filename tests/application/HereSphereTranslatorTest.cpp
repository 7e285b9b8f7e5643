/**
 * @file HereSphereTranslatorTest.cpp
 * @brief Unit-тесты перевода элементов Jellyfin в схему HereSphere
 */

#include <gtest/gtest.h>

#include "application/HereSphereTranslator.hpp"

#include <algorithm>

using namespace jellyvr;
using application::HereSphereTranslator;
using application::TranslationContext;

namespace {

domain::MediaItem makeMovie() {
    domain::MediaItem item;
    item.id = "movie-1";
    item.name = "Big Buck Bunny";
    item.type = "Movie";
    item.locationType = "FileSystem";
    item.overview = "A rabbit";
    item.runTimeTicks = 6000000000LL;   // 600000 мс
    item.communityRating = 7.0;
    item.premiereDate = "2008-05-20T00:00:00.0000000Z";
    item.dateCreated = "2023-01-02T10:11:12.0000000Z";
    item.productionYear = 2008;
    item.genres = {"Animation"};
    item.studios = {"Blender"};
    return item;
}

TranslationContext makeContext() {
    TranslationContext ctx;
    ctx.gatewayHost = "http://vr.local:3000";
    ctx.jellyfinBase = "http://jellyfin:8096";
    ctx.accessToken = "tok";
    return ctx;
}

std::vector<std::string> tagNames(const std::vector<domain::heresphere::Tag>& tags) {
    std::vector<std::string> names;
    for (const auto& tag : tags) names.push_back(tag.name);
    return names;
}

bool hasTag(const std::vector<domain::heresphere::Tag>& tags, const std::string& name) {
    auto names = tagNames(tags);
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

// ============================================================================
// ТЕСТЫ: поля карточки
// ============================================================================

TEST(HereSphereTranslatorTest, ToVideoData_Movie_MapsBasicFields) {
    auto video = HereSphereTranslator::toVideoData(makeMovie(), makeContext());

    EXPECT_EQ(video.title, "Big Buck Bunny");
    EXPECT_EQ(video.description, "A rabbit");
    EXPECT_DOUBLE_EQ(video.duration, 600000.0);
    EXPECT_DOUBLE_EQ(video.rating, 3.5);
    EXPECT_EQ(video.dateReleased, "2008-05-20");
    EXPECT_EQ(video.dateAdded, "2023-01-02");
    EXPECT_EQ(video.thumbnailImage,
              "http://jellyfin:8096/Items/movie-1/Images/Backdrop?maxHeight=300&maxWidth=300&quality=90&api_key=tok");
}

TEST(HereSphereTranslatorTest, Title_Episode_HasSeasonEpisodePrefix) {
    domain::MediaItem item;
    item.id = "ep-1";
    item.name = "Pilot";
    item.type = "Episode";
    item.parentIndexNumber = 1;
    item.indexNumber = 2;

    EXPECT_EQ(HereSphereTranslator::title(item), "S01E02 - Pilot");
}

TEST(HereSphereTranslatorTest, FormatDate_Missing_ReturnsEpoch) {
    EXPECT_EQ(HereSphereTranslator::formatDate(std::nullopt), "1970-01-01");
    EXPECT_EQ(HereSphereTranslator::formatDate(std::string("2020")), "1970-01-01");
}

TEST(HereSphereTranslatorTest, ToVideoData_NoOptionalFields_StillProducesCard) {
    domain::MediaItem item;
    item.id = "bare";
    item.name = "Bare";
    item.type = "Video";

    auto video = HereSphereTranslator::toVideoData(item, makeContext());

    EXPECT_DOUBLE_EQ(video.duration, 0.0);
    EXPECT_DOUBLE_EQ(video.rating, 0.0);
    EXPECT_TRUE(video.media.empty());
    EXPECT_EQ(tagNames(video.tags), std::vector<std::string>{"Type:Video"});
}

// ============================================================================
// ТЕСТЫ: теги
// ============================================================================

TEST(HereSphereTranslatorTest, Tags_Studio_AlsoEmittedAsSeries) {
    auto tags = HereSphereTranslator::tags(makeMovie());

    EXPECT_TRUE(hasTag(tags, "Studio:Blender"));
    EXPECT_TRUE(hasTag(tags, "Series:Blender"));
    EXPECT_TRUE(hasTag(tags, "Genre:Animation"));
    EXPECT_TRUE(hasTag(tags, "Movie:Big Buck Bunny"));
    EXPECT_TRUE(hasTag(tags, "Year:2008"));
}

TEST(HereSphereTranslatorTest, Tags_NoStudio_NoSeriesAlias) {
    auto item = makeMovie();
    item.studios.clear();

    auto tags = HereSphereTranslator::tags(item);

    for (const auto& name : tagNames(tags)) {
        EXPECT_NE(name.rfind("Studio:", 0), 0u) << name;
        EXPECT_NE(name.rfind("Series:", 0), 0u) << name;
    }
}

TEST(HereSphereTranslatorTest, Tags_SeriesStudioEqualsSeriesName_NoDuplicate) {
    domain::MediaItem item;
    item.id = "ep-1";
    item.name = "Pilot";
    item.type = "Episode";
    item.seriesName = "HBO";
    item.seriesStudio = "HBO";

    auto names = tagNames(HereSphereTranslator::tags(item));

    EXPECT_EQ(std::count(names.begin(), names.end(), "Series:HBO"), 1);
    EXPECT_EQ(std::count(names.begin(), names.end(), "Studio:HBO"), 1);
}

TEST(HereSphereTranslatorTest, Tags_People_WithAndWithoutRole) {
    auto item = makeMovie();
    item.people = {{"Jane Doe", "Actor", "Bunny"}, {"John Roe", "Director", ""}, {"", "Actor", "x"}};

    auto tags = HereSphereTranslator::tags(item);

    EXPECT_TRUE(hasTag(tags, "Actor:Jane Doe (Bunny)"));
    EXPECT_TRUE(hasTag(tags, "Actor:Jane Doe"));
    EXPECT_TRUE(hasTag(tags, "Director:John Roe"));
    EXPECT_FALSE(hasTag(tags, "Actor: (x)"));
}

TEST(HereSphereTranslatorTest, Tags_Chapters_EndAtNextChapterOrRuntime) {
    auto item = makeMovie();
    item.chapters = {{"Intro", 0}, {"", 1200000000LL}};

    auto tags = HereSphereTranslator::tags(item);

    ASSERT_GE(tags.size(), 2u);
    EXPECT_EQ(tags[0].name, "Chapter:Intro");
    EXPECT_DOUBLE_EQ(*tags[0].start, 0.0);
    EXPECT_DOUBLE_EQ(*tags[0].end, 120000.0);
    EXPECT_EQ(*tags[0].track, 0);
    EXPECT_EQ(tags[1].name, "Chapter:Unknown");
    EXPECT_DOUBLE_EQ(*tags[1].end, 600000.0);
}

// ============================================================================
// ТЕСТЫ: media и субтитры
// ============================================================================

TEST(HereSphereTranslatorTest, Media_RewritesToRemoteHost) {
    auto item = makeMovie();
    item.mediaSources = {{"src-1", "mkv", {}}};
    auto ctx = makeContext();
    ctx.jellyfinRemoteBase = "https://media.example.com";

    auto media = HereSphereTranslator::media(item, ctx);

    ASSERT_EQ(media.size(), 1u);
    EXPECT_EQ(media[0].name, "mkv");
    ASSERT_EQ(media[0].sources.size(), 1u);
    EXPECT_EQ(media[0].sources[0].url, "https://media.example.com/Items/src-1/Download?api_key=tok");
}

TEST(HereSphereTranslatorTest, Subtitles_OnlyTextStreamsInConfiguredLanguage) {
    auto item = makeMovie();
    domain::MediaSourceInfo source;
    source.id = "src-1";
    source.streams = {
        {2, "Subtitle", "srt", "eng", "English", true},
        {3, "Subtitle", "srt", "ger", "Deutsch", true},
        {4, "Subtitle", "pgssub", "eng", "English PGS", false},
        {1, "Audio", "aac", "eng", "", false},
    };
    item.mediaSources = {source};
    auto ctx = makeContext();
    ctx.subtitlesLanguage = "eng";

    auto subtitles = HereSphereTranslator::subtitles(item, ctx);

    ASSERT_EQ(subtitles.size(), 1u);
    EXPECT_EQ(subtitles[0].name, "English");
    EXPECT_EQ(subtitles[0].url,
              "http://jellyfin:8096/Videos/movie-1/src-1/Subtitles/2/Stream.srt?api_key=tok");
}

TEST(HereSphereTranslatorTest, ToLibrary_SkipsVirtualItems) {
    auto real = makeMovie();
    auto missing = makeMovie();
    missing.id = "movie-2";
    missing.locationType = "Virtual";

    auto library = HereSphereTranslator::toLibrary("Library", "http://vr.local:3000", {real, missing});

    ASSERT_EQ(library.list.size(), 1u);
    EXPECT_EQ(library.list[0], "http://vr.local:3000/heresphere/movie-1");
}
