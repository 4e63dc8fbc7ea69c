#include "backend/MetadataParser.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

namespace lorchestre::backend {

namespace {
    std::string trim(std::string_view str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return std::string(str.substr(first, last - first + 1));
    }

    std::optional<std::string> non_empty(std::string_view value) {
        std::string trimmed = trim(value);
        if (trimmed.empty()) return std::nullopt;
        return trimmed;
    }

    // ID3 frame id comparison ("TPE2", "TRCK")
    bool frame_is(const char id[4], const char* name) {
        return std::strncmp(id, name, 4) == 0;
    }

    std::string id3_string(const mpg123_string* s) {
        if (!s || !s->p || s->fill == 0) return "";
        // fill counts the terminating zero
        return std::string(s->p, s->fill - 1);
    }

    uint32_t average_kbps(const std::string& path, uint64_t duration_s) {
        if (duration_s == 0) return 0;
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return 0;
        return static_cast<uint32_t>(size * 8 / duration_s / 1000);
    }

    std::string image_mime_for_codec(AVCodecID id) {
        switch (id) {
            case AV_CODEC_ID_MJPEG: return "image/jpeg";
            case AV_CODEC_ID_PNG:   return "image/png";
            case AV_CODEC_ID_BMP:   return "image/bmp";
            case AV_CODEC_ID_GIF:   return "image/gif";
            case AV_CODEC_ID_TIFF:  return "image/tiff";
            case AV_CODEC_ID_WEBP:  return "image/webp";
            default:                return "";
        }
    }

    // First token of the demuxer name list that we have a MIME type for
    std::string audio_mime_for_demuxer(const char* names) {
        static const std::pair<std::string_view, std::string_view> table[] = {
            {"mp4", "audio/mp4"},   {"m4a", "audio/mp4"},   {"mov", "audio/mp4"},
            {"aac", "audio/aac"},   {"ogg", "audio/webm"},  {"webm", "audio/webm"},
            {"flac", "audio/flac"}, {"wav", "audio/wav"},   {"wv", "audio/wav"},
            {"aiff", "audio/aiff"}, {"mp3", "audio/mpeg"},  {"ape", "audio/ape"},
            {"mpc", "audio/mpc"},   {"mpc8", "audio/mpc"},
        };
        if (!names) return "application/octet-stream";

        std::string_view list(names);
        while (!list.empty()) {
            size_t comma = list.find(',');
            std::string_view token = list.substr(0, comma);
            for (const auto& [name, mime] : table) {
                if (token == name) return std::string(mime);
            }
            if (comma == std::string_view::npos) break;
            list.remove_prefix(comma + 1);
        }
        return "application/octet-stream";
    }

    struct FormatContextCloser {
        void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
    };
    using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;

    FormatContextPtr open_container(const std::string& path) {
        AVFormatContext* raw = nullptr;
        int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            char errbuf[256];
            av_strerror(ret, errbuf, sizeof(errbuf));
            util::Logger::debug("MetadataParser: libavformat cannot open " + path + " (" + errbuf + ")");
            return nullptr;
        }
        FormatContextPtr ctx(raw);
        ret = avformat_find_stream_info(ctx.get(), nullptr);
        if (ret < 0) {
            char errbuf[256];
            av_strerror(ret, errbuf, sizeof(errbuf));
            util::Logger::debug("MetadataParser: no stream info in " + path + " (" + errbuf + ")");
            return nullptr;
        }
        return ctx;
    }

    // Container-level tag first, then the audio stream's (Ogg keeps tags there)
    std::optional<std::string> container_tag(AVFormatContext* ctx, int audio_index, const char* key) {
        if (const AVDictionaryEntry* e = av_dict_get(ctx->metadata, key, nullptr, 0)) {
            if (auto v = non_empty(e->value)) return v;
        }
        if (audio_index >= 0) {
            const AVStream* stream = ctx->streams[audio_index];
            if (const AVDictionaryEntry* e = av_dict_get(stream->metadata, key, nullptr, 0)) {
                if (auto v = non_empty(e->value)) return v;
            }
        }
        return std::nullopt;
    }

    // Attached picture, preferring the one tagged as the front cover
    std::optional<CoverArt> attached_cover(AVFormatContext* ctx) {
        const AVStream* chosen = nullptr;
        for (unsigned i = 0; i < ctx->nb_streams; ++i) {
            const AVStream* stream = ctx->streams[i];
            if (!(stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) continue;
            if (stream->attached_pic.size <= 0) continue;

            const AVDictionaryEntry* comment = av_dict_get(stream->metadata, "comment", nullptr, 0);
            bool front = comment && std::strcmp(comment->value, "Cover (front)") == 0;
            if (!chosen || front) {
                chosen = stream;
                if (front) break;
            }
        }
        if (!chosen) return std::nullopt;

        CoverArt cover;
        const AVPacket& pkt = chosen->attached_pic;
        cover.bytes.assign(pkt.data, pkt.data + pkt.size);
        cover.mime = image_mime_for_codec(chosen->codecpar->codec_id);
        cover.ext = MetadataParser::cover_extension(cover.mime);
        return cover;
    }
}

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

// libavformat prints every probe failure to stderr otherwise
struct AvLogQuieter {
    AvLogQuieter() { av_log_set_level(AV_LOG_ERROR); }
};
static AvLogQuieter g_av_log_quieter;

RawTags MetadataParser::read_tags(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw TagReadError("not a regular file: " + path);
    }

    std::string ext = util::Platform::lower_extension(path);

    if (ext == ".mp3") {
        if (auto tags = parse_mp3(path)) return std::move(*tags);
        util::Logger::debug("MetadataParser: mpg123 rejected " + path + ", trying libavformat");
    } else if (is_sndfile_extension(ext)) {
        if (auto tags = parse_sndfile(path)) {
            supplement_from_container(path, *tags);
            return std::move(*tags);
        }
        util::Logger::debug("MetadataParser: libsndfile rejected " + path + ", trying libavformat");
    }

    if (auto tags = parse_container(path)) return std::move(*tags);

    throw TagReadError("unsupported or corrupt audio file: " + path);
}

std::optional<RawTags> MetadataParser::parse_mp3(const std::string& path) {
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return std::nullopt;

    struct HandleGuard {
        mpg123_handle* mh;
        bool opened = false;
        ~HandleGuard() {
            if (opened) mpg123_close(mh);
            mpg123_delete(mh);
        }
    } guard{mh};

    // Pictures are only collected when asked for before open
    mpg123_param(mh, MPG123_ADD_FLAGS, MPG123_PICTURE | MPG123_QUIET, 0.0);

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        return std::nullopt;
    }
    guard.opened = true;

    // Scan to get accurate length and parse ID3 tags
    if (mpg123_scan(mh) != MPG123_OK) {
        util::Logger::debug("MetadataParser: mpg123 scan failed for " + path);
        return std::nullopt;
    }

    long rate = 0;
    int channels = 0, encoding = 0;
    if (mpg123_getformat(mh, &rate, &channels, &encoding) != MPG123_OK || rate <= 0) {
        return std::nullopt;
    }

    RawTags tags;
    tags.mime = "audio/mpeg";

    off_t length = mpg123_length(mh);
    if (length > 0) {
        tags.duration_s = static_cast<uint64_t>(length) / static_cast<uint64_t>(rate);
    }

    mpg123_frameinfo mi{};
    bool have_info = mpg123_info(mh, &mi) == MPG123_OK;
    if (have_info) {
        tags.bitrate_kbps = static_cast<uint32_t>(mi.vbr == MPG123_ABR ? mi.abr_rate : mi.bitrate);
    }
    // The first frame's rate says little about a VBR file
    if (!have_info || mi.vbr == MPG123_VBR || tags.bitrate_kbps == 0) {
        tags.bitrate_kbps = average_kbps(path, tags.duration_s);
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            tags.title = non_empty(id3_string(v2->title));
            tags.artists = split_artists(id3_string(v2->artist));
            tags.album = non_empty(id3_string(v2->album));
            tags.year = parse_year(id3_string(v2->year));

            for (size_t i = 0; i < v2->texts; ++i) {
                const mpg123_text& frame = v2->text[i];
                if (frame_is(frame.id, "TRCK")) {
                    tags.track_number = parse_track_number(id3_string(&frame.text));
                } else if (frame_is(frame.id, "TPE2")) {
                    tags.album_artist = non_empty(id3_string(&frame.text));
                } else if (frame_is(frame.id, "TDRC") && !tags.year) {
                    tags.year = parse_year(id3_string(&frame.text));
                }
            }

            // APIC type 3 is the front cover; any picture beats none
            const mpg123_picture* chosen = nullptr;
            for (size_t i = 0; i < v2->pictures; ++i) {
                const mpg123_picture& pic = v2->picture[i];
                if (!pic.data || pic.size == 0) continue;
                if (!chosen || pic.type == 3) {
                    chosen = &pic;
                    if (pic.type == 3) break;
                }
            }
            if (chosen) {
                CoverArt cover;
                cover.bytes.assign(chosen->data, chosen->data + chosen->size);
                cover.mime = id3_string(&chosen->mime_type);
                cover.ext = cover_extension(cover.mime);
                tags.cover = std::move(cover);
            }
        } else if (v1) {
            tags.title = non_empty(std::string_view(v1->title, strnlen(v1->title, 30)));
            tags.artists = split_artists(std::string_view(v1->artist, strnlen(v1->artist, 30)));
            tags.album = non_empty(std::string_view(v1->album, strnlen(v1->album, 30)));
            tags.year = parse_year(std::string_view(v1->year, strnlen(v1->year, 4)));

            // ID3v1.1: track number is in comment[29] if comment[28] is null
            if (v1->comment[28] == 0 && v1->comment[29] != 0) {
                tags.track_number = static_cast<uint8_t>(v1->comment[29]);
            }
        }
    }

    return tags;
}

std::optional<RawTags> MetadataParser::parse_sndfile(const std::string& path) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) {
        util::Logger::debug("MetadataParser: libsndfile: " + std::string(sf_strerror(nullptr)));
        return std::nullopt;
    }

    RawTags tags;

    switch (sfinfo.format & SF_FORMAT_TYPEMASK) {
        case SF_FORMAT_FLAC: tags.mime = "audio/flac"; break;
        case SF_FORMAT_OGG:  tags.mime = "audio/webm"; break;
        case SF_FORMAT_WAV:
        case SF_FORMAT_WAVEX:
        case SF_FORMAT_RF64: tags.mime = "audio/wav"; break;
        case SF_FORMAT_AIFF: tags.mime = "audio/aiff"; break;
        default:             tags.mime = util::Platform::guess_mime_type(path); break;
    }

    if (sfinfo.samplerate > 0 && sfinfo.frames > 0) {
        tags.duration_s = static_cast<uint64_t>(sfinfo.frames / sfinfo.samplerate);
    }

    auto get_tag = [&](int tag_id) -> std::string {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? trim(val) : "";
    };

    tags.title = non_empty(get_tag(SF_STR_TITLE));
    tags.artists = split_artists(get_tag(SF_STR_ARTIST));
    tags.album = non_empty(get_tag(SF_STR_ALBUM));
    tags.year = parse_year(get_tag(SF_STR_DATE));
    tags.track_number = parse_track_number(get_tag(SF_STR_TRACKNUMBER));

    // sf_current_byterate() returns bytes/sec without reading the file
    int byterate = sf_current_byterate(sndfile);
    if (byterate > 0) {
        tags.bitrate_kbps = static_cast<uint32_t>(byterate) * 8 / 1000;
    } else {
        tags.bitrate_kbps = average_kbps(path, tags.duration_s);
    }

    sf_close(sndfile);
    return tags;
}

std::optional<RawTags> MetadataParser::parse_container(const std::string& path) {
    FormatContextPtr ctx = open_container(path);
    if (!ctx) return std::nullopt;

    int audio_index = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_index < 0) {
        util::Logger::debug("MetadataParser: no audio stream in " + path);
        return std::nullopt;
    }

    RawTags tags;
    tags.mime = audio_mime_for_demuxer(ctx->iformat ? ctx->iformat->name : nullptr);

    const AVStream* audio = ctx->streams[audio_index];
    if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
        tags.duration_s = static_cast<uint64_t>(ctx->duration / AV_TIME_BASE);
    } else if (audio->duration != AV_NOPTS_VALUE && audio->duration > 0) {
        tags.duration_s = static_cast<uint64_t>(audio->duration * av_q2d(audio->time_base));
    }

    if (ctx->bit_rate > 0) {
        tags.bitrate_kbps = static_cast<uint32_t>(ctx->bit_rate / 1000);
    } else if (audio->codecpar->bit_rate > 0) {
        tags.bitrate_kbps = static_cast<uint32_t>(audio->codecpar->bit_rate / 1000);
    }

    tags.title = container_tag(ctx.get(), audio_index, "title");
    if (auto artist = container_tag(ctx.get(), audio_index, "artist")) {
        tags.artists = split_artists(*artist);
    }
    tags.album = container_tag(ctx.get(), audio_index, "album");
    tags.album_artist = container_tag(ctx.get(), audio_index, "album_artist");
    if (auto track = container_tag(ctx.get(), audio_index, "track")) {
        tags.track_number = parse_track_number(*track);
    }
    if (auto date = container_tag(ctx.get(), audio_index, "date")) {
        tags.year = parse_year(*date);
    }
    tags.cover = attached_cover(ctx.get());

    return tags;
}

void MetadataParser::supplement_from_container(const std::string& path, RawTags& tags) {
    FormatContextPtr ctx = open_container(path);
    if (!ctx) return;

    int audio_index = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (!tags.album_artist) {
        tags.album_artist = container_tag(ctx.get(), audio_index, "album_artist");
    }
    if (!tags.cover) {
        tags.cover = attached_cover(ctx.get());
    }
}

bool MetadataParser::is_sndfile_extension(const std::string& ext) {
    return ext == ".flac" || ext == ".ogg" || ext == ".oga" || ext == ".wav" ||
           ext == ".aif" || ext == ".aiff";
}

std::vector<std::string> MetadataParser::split_artists(std::string_view value) {
    std::vector<std::string> artists;
    while (true) {
        size_t semi = value.find(';');
        std::string artist = trim(value.substr(0, semi));
        if (!artist.empty()) {
            artists.push_back(std::move(artist));
        }
        if (semi == std::string_view::npos) break;
        value.remove_prefix(semi + 1);
    }
    return artists;
}

std::optional<uint32_t> MetadataParser::parse_track_number(std::string_view value) {
    std::string trimmed = trim(value);
    uint32_t number = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
    if (ec != std::errc{} || ptr == trimmed.data()) {
        return std::nullopt;
    }
    return number;
}

std::optional<uint32_t> MetadataParser::parse_year(std::string_view value) {
    std::string trimmed = trim(value);
    if (trimmed.size() < 4 ||
        !std::all_of(trimmed.begin(), trimmed.begin() + 4,
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return std::nullopt;
    }
    uint32_t year = 0;
    std::from_chars(trimmed.data(), trimmed.data() + 4, year);
    if (year == 0) return std::nullopt;
    return year;
}

std::string MetadataParser::cover_extension(std::string_view image_mime) {
    std::string mime = trim(image_mime);
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (mime == "image/png") return ".png";
    if (mime == "image/jpeg" || mime == "image/jpg") return ".jpeg";
    if (mime == "image/tiff") return ".tiff";
    if (mime == "image/bmp") return ".bmp";
    if (mime == "image/gif") return ".gif";

    constexpr std::string_view prefix = "image/";
    if (mime.size() > prefix.size() && mime.compare(0, prefix.size(), prefix) == 0) {
        return "." + mime.substr(prefix.size());
    }
    return ".png";
}

}  // namespace lorchestre::backend
