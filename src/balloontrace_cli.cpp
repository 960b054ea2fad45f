#include <BalloonTraceAPI.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <cstdio>

using namespace std;

struct Arguments {
    string inputPath;
    string outputPath;
    string mode = "detect";
    bool valid = false;
    bool verbose = false;
    bool debug = false;

    // Text rectangle in pixels for expand/refine
    bool hasTextRect = false;
    double textX = 0.0, textY = 0.0, textW = 0.0, textH = 0.0;

    // Overrides; negative means keep the default
    double cannyLower = -1.0;
    double cannyUpper = -1.0;
    int morphKernelSize = -1;
    double minAreaRatio = -1.0;
    double maxAreaRatio = -1.0;
    double minBrightness = -1.0;
    int grabCutIterations = -1;
    double expansionMargin = -1.0;
};

bool parseRect(const string& text, Arguments& args) {
    return sscanf(text.c_str(), "%lf,%lf,%lf,%lf", &args.textX, &args.textY, &args.textW, &args.textH) == 4;
}

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    try {
        for (int i = 1; i < argc; i++) {
            string arg = argv[i];
            if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
                args.inputPath = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
                args.outputPath = argv[++i];
            } else if ((arg == "-m" || arg == "--mode") && (i + 1 < argc)) {
                args.mode = argv[++i];
            } else if ((arg == "-r" || arg == "--text-rect") && (i + 1 < argc)) {
                if (!parseRect(argv[++i], args)) {
                    cerr << "[ERROR] --text-rect expects x,y,width,height" << endl;
                    return args;
                }
                args.hasTextRect = true;
            } else if (arg == "-v" || arg == "--verbose") {
                args.verbose = true;
            } else if (arg == "-d" || arg == "--debug") {
                args.debug = true;
            } else if ((arg == "--canny-lower") && (i + 1 < argc)) {
                args.cannyLower = stod(argv[++i]);
            } else if ((arg == "--canny-upper") && (i + 1 < argc)) {
                args.cannyUpper = stod(argv[++i]);
            } else if ((arg == "--morph-kernel-size") && (i + 1 < argc)) {
                args.morphKernelSize = stoi(argv[++i]);
            } else if ((arg == "--min-area-ratio") && (i + 1 < argc)) {
                args.minAreaRatio = stod(argv[++i]);
            } else if ((arg == "--max-area-ratio") && (i + 1 < argc)) {
                args.maxAreaRatio = stod(argv[++i]);
            } else if ((arg == "--min-brightness") && (i + 1 < argc)) {
                args.minBrightness = stod(argv[++i]);
            } else if ((arg == "--iterations") && (i + 1 < argc)) {
                args.grabCutIterations = stoi(argv[++i]);
            } else if ((arg == "--margin") && (i + 1 < argc)) {
                args.expansionMargin = stod(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                return args; // Will trigger usage display
            }
        }
    } catch (const exception& e) {
        cerr << "[ERROR] Bad numeric argument: " << e.what() << endl;
        return args;
    }

    if (args.inputPath.empty()) {
        return args;
    }

    if (args.mode != "detect" && args.mode != "expand" && args.mode != "refine" &&
        args.mode != "enhance" && args.mode != "preprocess") {
        cerr << "[ERROR] Unknown mode: " << args.mode << endl;
        return args;
    }

    if ((args.mode == "expand" || args.mode == "refine") && !args.hasTextRect) {
        cerr << "[ERROR] Mode " << args.mode << " requires --text-rect" << endl;
        return args;
    }

    // Auto-generate output path if not provided
    if (args.outputPath.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        string stem = dotPos == string::npos ? args.inputPath : args.inputPath.substr(0, dotPos);
        args.outputPath = stem + "_" + args.mode + ".png";
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "BalloonTrace CLI - Detect speech balloons in comic pages\n"
         << "Using libballoontrace v" << balloon_trace_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-m <mode>] [-o <output_image>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Modes:\n"
         << "  detect      Detect balloons, print normalized rectangles, save marked image (default)\n"
         << "  expand      Grow --text-rect into its balloon, print the normalized rectangle\n"
         << "  refine      Outline the balloon around --text-rect, save the outline drawn on the image\n"
         << "  enhance     Save the OCR-enhanced image\n"
         << "  preprocess  Save the closed Canny edge map\n"
         << "\n"
         << "Optional:\n"
         << "  -o, --output  Output image path (auto-generated if not specified)\n"
         << "  -r, --text-rect <x,y,w,h>  Text rectangle in pixels (expand/refine)\n"
         << "  --canny-lower <value>      Canny lower threshold (default: 30)\n"
         << "  --canny-upper <value>      Canny upper threshold (default: 90)\n"
         << "  --morph-kernel-size <odd>  Closing kernel size (default: 15)\n"
         << "  --min-area-ratio <0-1>     Smallest accepted box area / image area (default: 0.001)\n"
         << "  --max-area-ratio <0-1>     Largest accepted box area / image area (default: 0.5)\n"
         << "  --min-brightness <0-255>   Darkest accepted mean balloon interior, 0 disables (default: 215)\n"
         << "  --iterations <n>           GrabCut iteration cap (default: 5)\n"
         << "  --margin <factor>          Background margin around the text box (default: 1.0)\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images to ./debug/)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i page.jpg\n"
         << "  " << progName << " -i page.jpg -m expand -r 320,180,140,60\n"
         << "  " << progName << " -i page.jpg -m refine -r 320,180,140,60 -o outline.png\n"
         << "  " << progName << " -i page.jpg --min-area-ratio 0.005 --morph-kernel-size 9\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(BalloonTraceResult error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

BalloonTraceImage wrapMat(cv::Mat& mat) {
    BalloonTraceImage image;
    image.data = mat.data;
    image.width = mat.cols;
    image.height = mat.rows;
    image.channels = mat.channels();
    image.stride = static_cast<int32_t>(mat.step[0]);
    return image;
}

bool saveImage(const BalloonTraceImage& image, const string& path) {
    cv::Mat view(image.height, image.width, CV_8UC(image.channels), image.data, image.stride);
    try {
        return cv::imwrite(path, view);
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
        return false;
    }
}

int runDetect(BalloonTraceImage& input, const BalloonTraceParams& params, const Arguments& args) {
    BalloonTraceDetection detection;
    BalloonTraceResult result = balloon_trace_detect_balloons(
        &input, &params, &detection,
        args.verbose ? progressCallback : nullptr,
        errorCallback);
    if (result != BALLOON_TRACE_SUCCESS) {
        cerr << "[ERROR] Detection failed: " << balloon_trace_get_error_message(result) << endl;
        return 1;
    }

    cout << "[INFO] Detected " << detection.count << " balloons" << endl;
    for (int32_t i = 0; i < detection.count; i++) {
        const BalloonTraceRect& r = detection.rects[i];
        cout << "  #" << (i + 1) << " x=" << r.x << " y=" << r.y << " w=" << r.width << " h=" << r.height
             << " (" << detection.contours[i].point_count << " contour points)" << endl;
    }

    bool saved = saveImage(detection.marked_image, args.outputPath);
    balloon_trace_free_detection(&detection);
    if (!saved) {
        cerr << "[ERROR] Failed to save marked image: " << args.outputPath << endl;
        return 1;
    }
    cout << "[INFO] Marked image saved to: " << args.outputPath << endl;
    return 0;
}

int runExpand(BalloonTraceImage& input, const BalloonTraceParams& params, const Arguments& args) {
    BalloonTraceRect textRect{args.textX, args.textY, args.textW, args.textH};
    BalloonTraceRect balloon;
    bool found = false;

    BalloonTraceResult result = balloon_trace_expand_text_region(&input, textRect, &params, &balloon, &found,
                                                                  errorCallback);
    if (result != BALLOON_TRACE_SUCCESS) {
        cerr << "[ERROR] Expansion failed: " << balloon_trace_get_error_message(result) << endl;
        return 1;
    }

    if (!found) {
        cout << "[INFO] No enclosing balloon found for the text region" << endl;
        return 0;
    }
    cout << "[INFO] Balloon: x=" << balloon.x << " y=" << balloon.y
         << " w=" << balloon.width << " h=" << balloon.height << endl;
    return 0;
}

int runRefine(cv::Mat& original, BalloonTraceImage& input, const BalloonTraceParams& params, const Arguments& args) {
    BalloonTraceRect textRect{args.textX, args.textY, args.textW, args.textH};
    BalloonTraceContour contour;

    BalloonTraceResult result = balloon_trace_refine_contour(&input, textRect, &params, &contour, errorCallback);
    if (result != BALLOON_TRACE_SUCCESS) {
        cerr << "[ERROR] Refinement failed: " << balloon_trace_get_error_message(result) << endl;
        return 1;
    }

    if (contour.point_count == 0) {
        cout << "[INFO] No balloon outline found for the text region" << endl;
        return 0;
    }

    vector<cv::Point> outline;
    for (int32_t i = 0; i < contour.point_count; i++) {
        outline.emplace_back(cvRound(contour.points[i].x * original.cols),
                             cvRound(contour.points[i].y * original.rows));
    }
    cout << "[INFO] Outline has " << contour.point_count << " points" << endl;
    balloon_trace_free_contour(&contour);

    cv::Mat marked = original.clone();
    vector<vector<cv::Point>> outlines = {outline};
    cv::drawContours(marked, outlines, 0, cv::Scalar(0, 255, 0), 2);

    bool saved = false;
    try {
        saved = cv::imwrite(args.outputPath, marked);
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
    }
    if (!saved) {
        cerr << "[ERROR] Failed to save outline image: " << args.outputPath << endl;
        return 1;
    }
    cout << "[INFO] Outline image saved to: " << args.outputPath << endl;
    return 0;
}

int runFilter(BalloonTraceImage& input, const BalloonTraceParams& params, const Arguments& args) {
    BalloonTraceImage output;
    BalloonTraceResult result = args.mode == "enhance"
        ? balloon_trace_enhance_for_ocr(&input, &params, &output, errorCallback)
        : balloon_trace_preprocess(&input, &params, &output, errorCallback);
    if (result != BALLOON_TRACE_SUCCESS) {
        cerr << "[ERROR] Processing failed: " << balloon_trace_get_error_message(result) << endl;
        return 1;
    }

    bool saved = saveImage(output, args.outputPath);
    balloon_trace_free_image(&output);
    if (!saved) {
        cerr << "[ERROR] Failed to save image: " << args.outputPath << endl;
        return 1;
    }
    cout << "[INFO] Output saved to: " << args.outputPath << endl;
    return 0;
}

int main(int argc, char* argv[]) {
    Arguments args = parseArguments(argc, argv);

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] BalloonTrace CLI v" << balloon_trace_get_version() << endl;
        cout << "[INFO] Mode " << args.mode << ": " << args.inputPath << " -> " << args.outputPath << endl;
    }

    cv::Mat image;
    try {
        image = cv::imread(args.inputPath, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
    }
    if (image.empty()) {
        cerr << "[ERROR] Input file is not a valid image or does not exist: " << args.inputPath << endl;
        return 1;
    }

    BalloonTraceParams params;
    balloon_trace_get_default_params(&params);
    params.verbose_output = args.verbose;

    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to ./debug/" << endl;
    }
    if (args.cannyLower > 0.0) params.canny_lower = args.cannyLower;
    if (args.cannyUpper > 0.0) params.canny_upper = args.cannyUpper;
    if (args.morphKernelSize > 0) params.morph_kernel_size = args.morphKernelSize;
    if (args.minAreaRatio >= 0.0) params.min_area_ratio = args.minAreaRatio;
    if (args.maxAreaRatio >= 0.0) params.max_area_ratio = args.maxAreaRatio;
    if (args.minBrightness >= 0.0) params.min_mean_brightness = args.minBrightness;
    if (args.grabCutIterations > 0) params.grabcut_iterations = args.grabCutIterations;
    if (args.expansionMargin > 0.0) params.expansion_margin = args.expansionMargin;

    BalloonTraceResult validation_result = balloon_trace_validate_params(&params);
    if (validation_result != BALLOON_TRACE_SUCCESS) {
        cerr << "[ERROR] Invalid parameters: " << balloon_trace_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Canny edges: " << params.canny_lower << "-" << params.canny_upper << endl;
        cout << "  Closing kernel: " << params.morph_kernel_size << endl;
        cout << "  Area band: " << params.min_area_ratio << "-" << params.max_area_ratio << endl;
        cout << "  GrabCut iterations: " << params.grabcut_iterations << ", margin " << params.expansion_margin << endl;
    }

    BalloonTraceImage input = wrapMat(image);

    if (args.mode == "detect") {
        return runDetect(input, params, args);
    } else if (args.mode == "expand") {
        return runExpand(input, params, args);
    } else if (args.mode == "refine") {
        return runRefine(image, input, params, args);
    }
    return runFilter(input, params, args);
}
