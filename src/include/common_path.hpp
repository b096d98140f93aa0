#pragma once

// Common path
#ifndef FRAMECOACH_ROOT
#define FRAMECOACH_ROOT							"/usr/local/share/framecoach/"
#endif
#define ASSET									FRAMECOACH_ROOT "assets/"

// YuNet face detector
#define YNMODEL_PATH							ASSET "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"

// Default config / log locations
#define CONFIG_PATH								FRAMECOACH_ROOT "config/"
#define CONFIG_FILE								"framecoach.json"

#define FRAMECOACH_LOG_DIR						"/var/log/framecoach"
#define FRAMECOACH_LOG_FILE						FRAMECOACH_LOG_DIR "/results.log"
