/*
 * Release lookup and version comparison
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cstring>

#define G_LOG_DOMAIN "json-glib"
#include "json-glib/json-glib.h"

#include "branchdconfig.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"
#include "version.hpp"

/* json-glib specific cleanup */
static forceinline void cleanup_json_parser(void *p) {
    JsonParser **parser = (JsonParser **)p;
    if (parser && *parser) {
        g_object_unref(*parser);
        *parser = nullptr;
    }
}

static forceinline void cleanup_gerror(void *p) {
    GError **error = (GError **)p;
    if (error && *error) {
        g_error_free(*error);
        *error = nullptr;
    }
}

#define autounref_json [[gnu::cleanup(cleanup_json_parser)]]
#define autofree_gerror [[gnu::cleanup(cleanup_gerror)]]

/* Returns the member's string value, or nullptr if it's absent or not a string */
static const char *get_string_member(JsonObject *object, const char *name) {
    JsonNode *node = json_object_get_member(object, name);
    if (!node || !JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING)
        return nullptr;
    return json_node_get_string(node);
}

RESULT parse_release_info(const char *json, size_t length, release_info &release) {
    if (!json)
        return MAKE_RESULT(SEV_ERROR, CAT_JSON, E_INVALID_ARG);

    autounref_json JsonParser *parser = json_parser_new();
    autofree_gerror GError *error = nullptr;

    if (!json_parser_load_from_data(parser, json, (gssize)length, &error)) {
        LOG_ERROR("Failed to parse release information: %s", error ? error->message : "unknown error");
        return MAKE_RESULT(SEV_ERROR, CAT_JSON, E_PARSE_ERROR);
    }

    JsonNode *root = json_parser_get_root(parser);
    if (!root || JSON_NODE_TYPE(root) != JSON_NODE_OBJECT) {
        LOG_ERROR("Release information is not a JSON object");
        return MAKE_RESULT(SEV_ERROR, CAT_JSON, E_PARSE_ERROR);
    }

    JsonObject *root_obj = json_node_get_object(root);

    /* Get tag name (version) */
    const char *tag = get_string_member(root_obj, "tag_name");
    if (!tag || !tag[0]) {
        LOG_ERROR("Release information has no usable tag_name");
        return MAKE_RESULT(SEV_ERROR, CAT_JSON, E_PARSE_ERROR);
    }

    const char *name = get_string_member(root_obj, "name");
    const char *html_url = get_string_member(root_obj, "html_url");

    release.tag = tag;
    release.name = name ? name : "";
    release.html_url = html_url ? html_url : "";

    return RESULT_OK;
}

RESULT fetch_latest_release(const char *url, release_info &release) {
    const char *headers[] = {"Accept: application/vnd.github+json", "X-GitHub-Api-Version: 2022-11-28", nullptr};
    std::string body;

    RESULT result = download_to_string(url, body, headers, config::METADATA_TIMEOUT);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to download release information");
        return result;
    }

    result = parse_release_info(body.data(), body.size(), release);
    if (FAILED(result)) {
        LOG_ERROR("Unusable release information from %s", url);
        return result;
    }

    LOG_DEBUG("Latest release: %s (%s)", release.tag.c_str(), release.html_url.c_str());
    return RESULT_OK;
}

bool version_is_stale(const char *current, const char *latest) {
    if (!current)
        return true;

    if (*current == 'v')
        current++;
    if (latest && *latest == 'v')
        latest++;

    /* Fresh or unversioned builds always offer to update */
    if (!current[0] || STRING_EQUALS(current, DEV_VERSION))
        return true;

    if (!latest)
        return false;

    return !STRING_EQUALS(current, latest);
}
