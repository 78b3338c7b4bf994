/**
 * @file FileCommands.hpp
 * @brief File system, archive and network commands.
 */

#pragma once

#include "application/Command.hpp"

namespace geoflow::application::commands {

/** CreateFolder(Folder, CreateParentFolders, IfFolderExists). */
class CreateFolder : public Command {
public:
    CreateFolder();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** CopyFile(SourceFile, DestinationFile, IfSourceFileNotFound). */
class CopyFile : public Command {
public:
    CopyFile();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** RemoveFile(SourceFile, IfSourceFileNotFound, RemoveIfFolder). */
class RemoveFile : public Command {
public:
    RemoveFile();

protected:
    void runCommand(WorkflowContext& context) override;
};

/**
 * ListFiles(Folder, IncludePatterns, ExcludePatterns, ListFiles, ListFolders, ListProperty, IfPropertyExists).
 * Stores the sorted entry names of a folder as a list property.
 */
class ListFiles : public Command {
public:
    ListFiles();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** UnzipFile(File, FileType, OutputFolder, DeleteFile). */
class UnzipFile : public Command {
public:
    UnzipFile();

protected:
    void runCommand(WorkflowContext& context) override;
};

/** WebGet(FileURL, OutputFile). */
class WebGet : public Command {
public:
    WebGet();

protected:
    void runCommand(WorkflowContext& context) override;
};

} // namespace geoflow::application::commands
