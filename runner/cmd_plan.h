#pragma once

// warden_cli analyze <env> <plan|->
int cmd_analyze(int argc, char** argv);

// warden_cli execute <env> <plan|-> [--task T] [--approve PHRASE] [--note N]
int cmd_execute(int argc, char** argv);

// warden_cli report <env> <plan|-> [--out file.md]
int cmd_report(int argc, char** argv);
