/**
 * @file FileCommands.cpp
 * @brief Implementation of the file system, archive and network commands.
 */

#include "application/commands/FileCommands.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "application/commands/CommandUtil.hpp"

namespace geoflow::application::commands {

namespace fs = std::filesystem;
using domain::Severity;

namespace {

/**
 * Maps an If...NotFound choice onto the check policy. Ignore has no policy:
 * the caller skips the check and the effect silently.
 */
std::optional<FailPolicy> NotFoundPolicy(const std::string& choice) {
    if (choice == "Fail") return FailPolicy::Fail;
    if (choice == "Warn") return FailPolicy::WarnButDoNotRun;
    return std::nullopt;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// --- CreateFolder ---

CreateFolder::CreateFolder()
    : Command("CreateFolder", {
          {"Folder", ParameterType::String, true, {}, "Folder to create."},
          {"CreateParentFolders", ParameterType::Bool, false, {}, "Create missing parent folders (default False)."},
          {"IfFolderExists", ParameterType::Choice, false, NotFoundChoices(), "Action when the folder exists (default Ignore)."}
      }) {}

void CreateFolder::runCommand(WorkflowContext& context) {
    const std::string folder = resolvePathParameter(context, "Folder");
    const bool createParents = boolParameter("CreateParentFolders", false);
    const std::string ifExists = stringParameter("IfFolderExists", "Ignore");

    if (fs::is_directory(folder)) {
        if (ifExists == "Warn") {
            logRun(Severity::Warning, "The folder (" + folder + ") already exists.",
                   "Remove the folder first or set IfFolderExists=\"Ignore\".");
        } else if (ifExists == "Fail") {
            blockRun(Severity::Failure, "The folder (" + folder + ") already exists.",
                     "Remove the folder first or set IfFolderExists=\"Ignore\".");
        }
        return;
    }
    if (!createParents) {
        require(context, checks::ParentFolderExists{folder}, FailPolicy::Fail);
    }
    if (isBlocked()) return;

    if (createParents) {
        fs::create_directories(folder);
    } else {
        fs::create_directory(folder);
    }
}

// --- CopyFile ---

CopyFile::CopyFile()
    : Command("CopyFile", {
          {"SourceFile", ParameterType::String, true, {}, "File to copy."},
          {"DestinationFile", ParameterType::String, true, {}, "Copy to create; overwritten if it exists."},
          {"IfSourceFileNotFound", ParameterType::Choice, false, NotFoundChoices(), "Action when the source is missing (default Warn)."}
      }) {}

void CopyFile::runCommand(WorkflowContext& context) {
    const std::string source = resolvePathParameter(context, "SourceFile");
    const std::string destination = resolvePathParameter(context, "DestinationFile");
    const auto policy = NotFoundPolicy(stringParameter("IfSourceFileNotFound", "Warn"));

    if (!fs::is_regular_file(source)) {
        if (policy) require(context, checks::FileExists{source}, *policy);
        return;
    }
    require(context, checks::ParentFolderExists{destination}, FailPolicy::Fail);
    if (isBlocked()) return;

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
}

// --- RemoveFile ---

RemoveFile::RemoveFile()
    : Command("RemoveFile", {
          {"SourceFile", ParameterType::String, true, {}, "File to remove."},
          {"IfSourceFileNotFound", ParameterType::Choice, false, NotFoundChoices(), "Action when the file is missing (default Warn)."},
          {"RemoveIfFolder", ParameterType::Bool, false, {}, "Allow removing a folder and its contents (default False)."}
      }) {}

void RemoveFile::runCommand(WorkflowContext& context) {
    const std::string source = resolvePathParameter(context, "SourceFile");
    const auto policy = NotFoundPolicy(stringParameter("IfSourceFileNotFound", "Warn"));
    const bool removeFolder = boolParameter("RemoveIfFolder", false);

    if (!fs::exists(source)) {
        if (policy) require(context, checks::FileExists{source}, *policy);
        return;
    }
    if (fs::is_directory(source)) {
        if (!removeFolder) {
            blockRun(Severity::Failure, "The path (" + source + ") is a folder.",
                     "Set RemoveIfFolder=\"True\" to remove folders.");
            return;
        }
        fs::remove_all(source);
        return;
    }
    fs::remove(source);
}

// --- ListFiles ---

ListFiles::ListFiles()
    : Command("ListFiles", {
          {"Folder", ParameterType::String, true, {}, "Folder to list."},
          {"IncludePatterns", ParameterType::List, false, {}, "Glob patterns of names to include (default all)."},
          {"ExcludePatterns", ParameterType::List, false, {}, "Glob patterns of names to exclude."},
          {"ListFiles", ParameterType::Bool, false, {}, "Include files (default True)."},
          {"ListFolders", ParameterType::Bool, false, {}, "Include folders (default False)."},
          {"ListProperty", ParameterType::String, true, {}, "Property receiving the list."},
          {"IfPropertyExists", ParameterType::Choice, false, CollisionChoices(), "Action when the property exists (default Replace)."}
      }) {}

void ListFiles::runCommand(WorkflowContext& context) {
    const std::string folder = resolvePathParameter(context, "Folder");
    const std::string property = resolveParameter(context, "ListProperty");
    std::vector<std::string> includes = listParameter("IncludePatterns");
    const std::vector<std::string> excludes = listParameter("ExcludePatterns");
    const bool listFiles = boolParameter("ListFiles", true);
    const bool listFolders = boolParameter("ListFolders", false);
    const domain::CollisionPolicy policy = collisionPolicy("IfPropertyExists");
    if (includes.empty()) {
        includes.push_back("*");
    }

    require(context, checks::FolderExists{folder}, FailPolicy::Fail);
    if (context.properties.contains(property)) {
        const std::string message = "The property (" + property + ") already exists.";
        const std::string recommendation = "Specify a new ListProperty or change IfPropertyExists.";
        switch (policy) {
            case domain::CollisionPolicy::Replace:
                break;
            case domain::CollisionPolicy::ReplaceAndWarn:
                logRun(Severity::Warning, message + " It will be replaced.", recommendation);
                break;
            case domain::CollisionPolicy::Warn:
                blockRun(Severity::Warning, message, recommendation);
                break;
            case domain::CollisionPolicy::Fail:
                blockRun(Severity::Failure, message, recommendation);
                break;
        }
    }
    if (isBlocked()) return;

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(folder)) {
        const bool isFolder = entry.is_directory();
        if ((isFolder && !listFolders) || (!isFolder && !listFiles)) continue;

        const std::string name = entry.path().filename().string();
        const bool included = std::any_of(includes.begin(), includes.end(),
                                          [&](const std::string& p) { return GlobMatch(p, name); });
        const bool excluded = std::any_of(excludes.begin(), excludes.end(),
                                          [&](const std::string& p) { return GlobMatch(p, name); });
        if (included && !excluded) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    context.properties.set(property, names);
}

// --- UnzipFile ---

UnzipFile::UnzipFile()
    : Command("UnzipFile", {
          {"File", ParameterType::String, true, {}, "Archive to extract."},
          {"FileType", ParameterType::Choice, false, {"zip", "tar"}, "Archive format (default from the extension)."},
          {"OutputFolder", ParameterType::String, false, {}, "Destination folder (default the archive's folder)."},
          {"DeleteFile", ParameterType::Bool, false, {}, "Remove the archive after extraction (default False)."}
      }) {}

void UnzipFile::runCommand(WorkflowContext& context) {
    const std::string archive = resolvePathParameter(context, "File");
    std::string outputFolder = resolvePathParameter(context, "OutputFolder");
    if (outputFolder.empty()) {
        outputFolder = fs::path(archive).parent_path().generic_string();
    }
    const bool deleteFile = boolParameter("DeleteFile", false);

    std::string type = stringParameter("FileType");
    if (type.empty()) {
        std::string lowered = archive;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (EndsWith(lowered, ".zip")) {
            type = "zip";
        } else if (EndsWith(lowered, ".tar") || EndsWith(lowered, ".tar.gz") || EndsWith(lowered, ".tgz")) {
            type = "tar";
        } else {
            blockRun(Severity::Failure, "The archive type of (" + archive + ") cannot be determined from its extension.",
                     "Specify FileType=\"zip\" or FileType=\"tar\".");
        }
    }

    require(context, checks::FileExists{archive}, FailPolicy::Fail);
    require(context, checks::FolderExists{outputFolder}, FailPolicy::Fail);
    if (isBlocked()) return;

    domain::ArchiveService& archives = RequireService(context.services.archiveService, "archive service");
    archives.extract(archive, outputFolder, type == "zip" ? domain::ArchiveFormat::Zip : domain::ArchiveFormat::Tar);
    if (deleteFile) {
        fs::remove(archive);
    }
}

// --- WebGet ---

WebGet::WebGet()
    : Command("WebGet", {
          {"FileURL", ParameterType::String, true, {}, "URL to download."},
          {"OutputFile", ParameterType::String, false, {}, "Local file (default the URL's file name in WorkingDir)."}
      }) {}

void WebGet::runCommand(WorkflowContext& context) {
    const std::string url = resolveParameter(context, "FileURL");

    std::string outputFile = resolvePathParameter(context, "OutputFile");
    if (outputFile.empty()) {
        std::string name = url.substr(url.find_last_of('/') + 1);
        name = name.substr(0, name.find_first_of("?#"));
        if (name.empty()) {
            name = "download";
        }
        outputFile = resolvePath(context, name);
    }

    require(context, checks::UrlValid{url}, FailPolicy::WarnButDoNotRun);
    require(context, checks::ParentFolderExists{outputFile}, FailPolicy::Fail);
    if (isBlocked()) return;

    RequireService(context.services.downloader, "downloader").download(url, outputFile);
}

} // namespace geoflow::application::commands
