#pragma once
#include <string>
#include <vector>
#include <optional>
#include "HtmlDocument.hpp"

namespace GateResolve {
namespace ScriptScanner {

// Literal navigation targets: location = "...", location.href = "...",
// location.replace/assign("..."), window.open("...").
std::vector<std::string> NavigationTargets(const std::string& script);

// location.href = someVar; resolved through a literal assignment to someVar anywhere in the scripts.
std::vector<std::string> IndirectNavigationTargets(const std::vector<std::string>& scripts);

// Absolute URL literals assigned to variables named like a link (link, url, dest, redirect, ...).
std::vector<std::string> LinkVariables(const std::string& script);

// Element hrefs set from script: el.href = "...", el.setAttribute("href", "...").
std::vector<std::string> HrefAssignments(const std::string& script);

// Endpoints of secondary in-page requests (fetch, $.ajax, $.get/post/getJSON, axios, xhr.open).
std::vector<std::string> SecondaryRequestEndpoints(const std::string& script);

// Arguments of atob("...") calls.
std::vector<std::string> AtobLiterals(const std::string& text);

// Every absolute http(s) URL appearing in the text, in order.
std::vector<std::string> AbsoluteUrls(const std::string& text);

// Target of <meta http-equiv="refresh" content="N; url=...">.
std::optional<std::string> MetaRefreshTarget(const HtmlDocument& doc);

// Timer constructs: setTimeout/setInterval with a counter, returns the announced wait in seconds if one is found.
bool HasTimer(const std::string& script);
std::optional<int> AnnouncedSeconds(const std::string& script);

}
}
